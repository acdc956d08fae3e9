#include <libhostlink/crash.hxx>

#include <libhostlink/host.hxx>
#include <libhostlink/diagnostics.hxx>

#include <xxhash.h>

namespace hostlink
{
  const char*
  to_string (crash_phase p)
  {
    switch (p)
    {
    case crash_phase::idle:      return "idle";
    case crash_phase::crashed:   return "crashed";
    case crash_phase::recovered: return "recovered";
    }

    return "unknown";
  }

  crash_recovery::crash_recovery (context& c)
    : ctx_ (c)
  {
  }

  void
  crash_recovery::session_started ()
  {
    if (phase_ == crash_phase::crashed)
      phase_ = crash_phase::recovered;
  }

  uint64_t
  crash_recovery::fingerprint (const string& m, const string& s)
  {
    // Separate the parts so that moving text between them changes the
    // digest.
    //
    string d (m);
    d += '\0';
    d += s;
    return XXH64 (d.data (), d.size (), 0);
  }

  void
  crash_recovery::handle (session* s, unhandled_exception& e)
  {
    // Never let the host see the exception, not even on a repeat.
    //
    e.handled = true;

    struct enable_button
    {
      command_button& b;

      ~enable_button ()
      {
        try
        {
          b.enable (true);
        }
        catch (...)
        {
          cerr << "error: unable to re-enable command: "
               << describe (std::current_exception ()) << endl;
        }
      }
    };

    enable_button eb {ctx_.button};

    // Only handle a single crash per session.
    //
    if (s == nullptr || s->crash.handled)
      return;

    s->crash.handled = true;
    s->crash.message = e.message;
    phase_ = crash_phase::crashed;

    cerr << "error: unhandled exception: " << e.message << endl;

    best_effort ("log exception to telemetry", [this, &e] ()
    {
      ctx_.tel.log_exception (e.message);
    });

    best_effort ("notify telemetry of crash", [this, &e] ()
    {
      ctx_.tel.notify_crash (fingerprint (e.message, e.stack));
    });

    core_model* cm (s->core ());
    view_model* vm (s->view ());

    if (cm != nullptr)
    {
      best_effort ("log crash to model", [cm, &e] ()
      {
        cm->log_error ("unhandled exception");
        cm->log_error (e.message);
      });

      best_effort ("prompt for crash", [cm, &e] ()
      {
        cm->set_crashing (true);
        cm->request_crash_prompt (e.message + "\n\n" + e.stack);
      });
    }

    // Exiting the view may close it synchronously and with it end the
    // session. Nothing below may touch the session.
    //
    if (vm != nullptr)
      best_effort ("exit view", [vm] () {vm->exit (false);});
  }
}
