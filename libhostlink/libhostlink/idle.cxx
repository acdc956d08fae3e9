#include <libhostlink/idle.hxx>

#include <libhostlink/diagnostics.hxx>

namespace hostlink
{
  idle_pump::idle_pump (host_application& h, idle_scheduler& s)
    : host_ (h),
      sched_ (s)
  {
  }

  idle_pump::~idle_pump ()
  {
    best_effort ("detach idle pump", [this] () {detach ();});
  }

  bool
  idle_pump::attach ()
  {
    if (connection_)
      return false;

    connection_ = host_.connect (host_event::idling,
                                 [this] (const event_args&)
    {
      sched_.poll ();
    });

    return true;
  }

  bool
  idle_pump::detach ()
  {
    if (!connection_)
      return false;

    connection c (*connection_);
    connection_.reset ();
    host_.disconnect (c);
    return true;
  }
}
