#pragma once

#include <libhostlink/types.hxx>
#include <libhostlink/host.hxx>
#include <libhostlink/context.hxx>
#include <libhostlink/session.hxx>
#include <libhostlink/scheduler.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  // Deletes the session's visualization marker exactly once.
  //
  // Deletion mutates the host document and therefore runs on the idle
  // context inside a host transaction. The marker id is taken out of the
  // session as soon as the deletion is scheduled, so scheduling twice before
  // the first task ran deletes once.
  //
  // A failed deletion abandons the marker: the id is not put back and no
  // retry is attempted.
  //
  class LIBHOSTLINK_SYMEXPORT marker_cleaner
  {
  public:
    marker_cleaner (context&, idle_scheduler&);

    // Take the marker id and queue its deletion. Return false (and queue
    // nothing) if there is no view model or no valid marker.
    //
    // The completion, if given, receives the deletion failure (always a
    // resource_cleanup_error) or null. Without one, failures are logged.
    //
    bool
    schedule (session&, function<void (exception_ptr)> completion = nullptr);

    // Delete the marker in the active document. No-op without an active
    // document or with an invalid id. The transaction is committed even if
    // the deletion fails.
    //
    // Throws idle_affinity_error outside the idle context and
    // resource_cleanup_error if starting, deleting, or committing fails.
    //
    void
    erase (resource_id);

  private:
    context& ctx_;
    idle_scheduler& sched_;
  };
}
