#pragma once

#include <libhostlink/types.hxx>
#include <libhostlink/host.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  // Everything the core model needs to start, resolved once by the
  // initialization gate.
  //
  struct start_configuration
  {
    fs::path core_path;
    string geometry_factory_path;

    // Host context (see host_context()). Filled in for every session.
    //
    string context;
  };

  // Visualization state owned by the view model. The marker is a transient
  // host element that keeps in-progress geometry visible.
  //
  struct visualization_state
  {
    resource_id marker;
  };

  // Payload of an exception that escaped into the UI dispatch loop.
  //
  // Setting handled tells the host not to terminate.
  //
  struct unhandled_exception
  {
    exception_ptr error;
    string message;
    string stack;
    bool handled = false;
  };

  class LIBHOSTLINK_SYMEXPORT core_model
  {
  public:
    virtual
    ~core_model ();

    virtual void
    post_initialize () = 0;

    virtual void
    open_workspace (const string& path) = 0;

    // Host lifecycle notification forwarded by the extension.
    //
    virtual void
    handle (const event_args&) = 0;

    virtual void
    log_error (const string&) = 0;

    virtual void
    set_crashing (bool) = 0;

    virtual void
    request_crash_prompt (const string& details) = 0;

    // Register a callback invoked when the model begins shutting down.
    //
    virtual void
    on_shutdown_started (function<void ()>) = 0;
  };

  class LIBHOSTLINK_SYMEXPORT view_model
  {
  public:
    virtual
    ~view_model ();

    virtual visualization_state&
    visualization () = 0;

    // Close the UI. With allow_cancel false the user cannot abort.
    //
    virtual void
    exit (bool allow_cancel) = 0;
  };

  // Window/view construction collaborator.
  //
  class LIBHOSTLINK_SYMEXPORT model_factory
  {
  public:
    virtual
    ~model_factory ();

    virtual unique_ptr<core_model>
    make_core_model (const start_configuration&) = 0;

    virtual unique_ptr<view_model>
    make_view_model (core_model&) = 0;

    // Build and show the main window for the view model. The host reports
    // its closing through extension::view_closed() and its dispatch failures
    // through extension::dispatch_failed().
    //
    virtual void
    show_view (view_model&) = 0;
  };
}
