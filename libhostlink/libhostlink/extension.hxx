#pragma once

#include <chrono>

#include <libhostlink/types.hxx>
#include <libhostlink/host.hxx>
#include <libhostlink/gate.hxx>
#include <libhostlink/idle.hxx>
#include <libhostlink/crash.hxx>
#include <libhostlink/model.hxx>
#include <libhostlink/cleanup.hxx>
#include <libhostlink/context.hxx>
#include <libhostlink/journal.hxx>
#include <libhostlink/session.hxx>
#include <libhostlink/scheduler.hxx>
#include <libhostlink/subscription.hxx>

#include <libhostlink/utility/scheduler.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  enum class command_result
  {
    succeeded,
    failed,
    cancelled
  };

  LIBHOSTLINK_SYMEXPORT const char*
  to_string (command_result);

  struct extension_config
  {
    initialization_options init;

    // Journal key naming a workspace to open once the view is shown.
    //
    string workspace_key = "dynPath";

    // Run when the journal's debug flag is set. Defaults to waiting for a
    // debugger for debugger_timeout.
    //
    function<void ()> debugger_hook;
    std::chrono::milliseconds debugger_timeout {std::chrono::minutes (1)};
  };

  // The extension as seen by the host: one command entry point plus the
  // view and UI dispatch notifications.
  //
  // The extension lives as long as the host process keeps the module loaded.
  // Each successful execute() starts a session that ends when the view
  // closes.
  //
  class LIBHOSTLINK_SYMEXPORT extension
  {
  public:
    // Register the idle strand on the scheduler and attach the idle pump.
    //
    extension (context&, utility::scheduler&, extension_config = {});
    ~extension ();

    extension (const extension&) = delete;
    extension& operator= (const extension&) = delete;

    // Entry point. On failure, message describes the problem. Never throws
    // std::exception.
    //
    command_result
    execute (const command_data&, string& message);

    // The view closed: unsubscribe, end the session and re-enable the
    // command. Idempotent.
    //
    void
    view_closed ();

    // An exception escaped into the UI dispatch loop.
    //
    void
    dispatch_failed (unhandled_exception&);

    session*
    current_session () const {return session_.get ();}

    idle_scheduler&
    idle () {return sched_;}

    const initialization_gate&
    gate () const {return gate_;}

    const subscription_registry&
    subscriptions () const {return subscriptions_;}

    crash_phase
    crash_status () const {return crash_.phase ();}

  private:
    void
    handle_debug (const journal_data&);

    void
    start_session (const command_data&);

    void
    end_session ();

    void
    dispatch (const event_args&);

    context& ctx_;
    extension_config config_;

    idle_scheduler sched_;
    idle_pump pump_;
    initialization_gate gate_;
    subscription_registry subscriptions_;
    marker_cleaner cleaner_;
    crash_recovery crash_;

    unique_ptr<session> session_;

    bool handling_failure_ = false;
    bool close_pending_ = false;
  };
}
