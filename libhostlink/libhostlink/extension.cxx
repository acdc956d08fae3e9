#include <libhostlink/extension.hxx>

#include <libhostlink/error.hxx>
#include <libhostlink/diagnostics.hxx>

namespace hostlink
{
  namespace
  {
    const vector<host_event> lifecycle_events {
      host_event::view_activating,
      host_event::view_activated,
      host_event::document_opened,
      host_event::document_closing,
      host_event::document_closed};
  }

  const char*
  to_string (command_result r)
  {
    switch (r)
    {
    case command_result::succeeded: return "succeeded";
    case command_result::failed:    return "failed";
    case command_result::cancelled: return "cancelled";
    }

    return "unknown";
  }

  extension::extension (context& c, utility::scheduler& s, extension_config o)
    : ctx_ (c),
      config_ (move (o)),
      sched_ (s),
      pump_ (c.host, sched_),
      gate_ (config_.init),
      subscriptions_ (c.host),
      cleaner_ (c, sched_),
      crash_ (c)
  {
    pump_.attach ();
  }

  extension::~extension ()
  {
    best_effort ("end session", [this] () {end_session ();});
  }

  command_result
  extension::execute (const command_data& cd, string& m)
  {
    best_effort ("handle debug request",
                 [this, &cd] () {handle_debug (cd.journal);});

    try
    {
      gate_.initialize_once (ctx_);
    }
    catch (const exception& e)
    {
      m = e.what ();
      cerr << "error: unable to initialize: " << m << endl;

      best_effort ("show message", [this, &m] () {ctx_.host.show_message (m);});
      best_effort ("enable command", [this] () {ctx_.button.enable (true);});

      return command_result::failed;
    }

    if (session_ != nullptr)
    {
      m = "extension is already running";
      return command_result::cancelled;
    }

    try
    {
      start_session (cd);
    }
    catch (const exception& e)
    {
      m = e.what ();
      cerr << "error: unable to start: " << m << endl;

      best_effort ("log exception to telemetry",
                   [this, &m] () {ctx_.tel.log_exception (m);});
      best_effort ("notify telemetry of crash",
                   [this, &m] ()
      {
        ctx_.tel.notify_crash (crash_recovery::fingerprint (m, ""));
      });
      best_effort ("show message", [this, &m] () {ctx_.host.show_message (m);});
      best_effort ("end session", [this] () {end_session ();});
      best_effort ("enable command", [this] () {ctx_.button.enable (true);});

      return command_result::failed;
    }

    return command_result::succeeded;
  }

  void
  extension::view_closed ()
  {
    // The view may close from inside the crash sequence (forced exit). End
    // the session once that sequence has returned.
    //
    if (handling_failure_)
    {
      close_pending_ = true;
      return;
    }

    end_session ();
    ctx_.button.enable (true);
  }

  void
  extension::dispatch_failed (unhandled_exception& e)
  {
    handling_failure_ = true;
    crash_.handle (session_.get (), e);
    handling_failure_ = false;

    if (close_pending_)
    {
      close_pending_ = false;
      view_closed ();
    }
  }

  void
  extension::handle_debug (const journal_data& j)
  {
    optional<string> v (journal_value (j, "debug"));

    if (!v)
      return;

    optional<bool> f (parse_flag (*v));

    if (!f)
    {
      cerr << "warning: ignoring invalid debug value '" << *v << "'" << endl;
      return;
    }

    if (*f)
    {
      if (config_.debugger_hook)
        config_.debugger_hook ();
      else
        wait_for_debugger (config_.debugger_timeout);
    }
  }

  void
  extension::start_session (const command_data& cd)
  {
    start_configuration c (gate_.configuration ());
    c.context = host_context (ctx_.host.version_name ());

    session_ = make_unique<session> ();
    session_->initialized_core = gate_.initialized ();
    crash_.session_started ();

    session_->attach (ctx_.factory.make_core_model (c));
    core_model& cm (*session_->core ());

    session_->attach (ctx_.factory.make_view_model (cm));
    view_model& vm (*session_->view ());

    // Delete the marker once the model starts shutting down.
    //
    cm.on_shutdown_started ([this] ()
    {
      if (session_ != nullptr)
        cleaner_.schedule (*session_);
    });

    cm.post_initialize ();
    ctx_.factory.show_view (vm);

    if (optional<string> p = journal_value (cd.journal, config_.workspace_key))
      cm.open_workspace (*p);

    subscription_registry::handler_set hs;
    for (host_event e: lifecycle_events)
      hs.emplace_back (e, [this] (const event_args& a) {dispatch (a);});

    subscriptions_.subscribe (hs);
    session_->application_events_subscribed = true;

    // Prevent a re-run while the view is open.
    //
    ctx_.button.enable (false);

#if LIBHOSTLINK_DEVELOP
    cerr << "info: session started" << endl;
#endif
  }

  void
  extension::end_session ()
  {
    for (host_event e: lifecycle_events)
      best_effort ("unsubscribe from host event",
                   [this, e] () {subscriptions_.remove (e);});

    if (session_ == nullptr)
      return;

    session_->application_events_subscribed = false;
    session_->detach ();
    session_.reset ();

#if LIBHOSTLINK_DEVELOP
    cerr << "info: session ended" << endl;
#endif
  }

  void
  extension::dispatch (const event_args& a)
  {
    if (session_ != nullptr && session_->core () != nullptr)
      session_->core ()->handle (a);
  }
}
