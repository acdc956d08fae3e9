#pragma once

#include <libhostlink/types.hxx>
#include <libhostlink/host.hxx>
#include <libhostlink/scheduler.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  // Drives the idle scheduler from the host's idle notification.
  //
  // Once attached, every host idle tick drains the scheduler. The pump
  // detaches itself on destruction.
  //
  class LIBHOSTLINK_SYMEXPORT idle_pump
  {
  public:
    idle_pump (host_application&, idle_scheduler&);
    ~idle_pump ();

    idle_pump (const idle_pump&) = delete;
    idle_pump& operator= (const idle_pump&) = delete;

    // Return false if already attached.
    //
    bool
    attach ();

    // Return false if not attached.
    //
    bool
    detach ();

    bool
    attached () const {return connection_.has_value ();}

  private:
    host_application& host_;
    idle_scheduler& sched_;
    optional<connection> connection_;
  };
}
