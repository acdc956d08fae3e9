#pragma once

#include <libhostlink/types.hxx>
#include <libhostlink/host.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  // Host event registrations, at most one per event kind.
  //
  // The entry point may run several times per process without a matching
  // teardown, so every operation here is idempotent and reports whether it
  // actually changed anything.
  //
  class LIBHOSTLINK_SYMEXPORT subscription_registry
  {
  public:
    using handler_set = vector<std::pair<host_event, event_handler>>;

    explicit
    subscription_registry (host_application&);

    // Detach every active registration. Host failures are logged.
    //
    ~subscription_registry ();

    subscription_registry (const subscription_registry&) = delete;
    subscription_registry& operator= (const subscription_registry&) = delete;

    // Attach the handler unless the kind is already active. Return true if
    // attached. Throws std::invalid_argument if the handler is empty.
    //
    bool
    add (host_event, event_handler);

    // Detach the kind if active. Return true if detached.
    //
    bool
    remove (host_event);

    bool
    active (host_event) const;

    // Number of active kinds.
    //
    size_t
    size () const;

    // Apply add() to each entry and return how many kinds were attached.
    //
    size_t
    subscribe (const handler_set&);

    // Apply remove() to each kind and return how many were detached.
    //
    size_t
    unsubscribe (const vector<host_event>&);

    // Detach everything. Return how many kinds were detached.
    //
    size_t
    clear ();

  private:
    host_application& host_;
    array<optional<connection>, host_event_count> slots_;
  };
}
