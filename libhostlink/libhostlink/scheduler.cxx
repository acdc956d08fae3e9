#include <libhostlink/scheduler.hxx>

#include <libhostlink/error.hxx>
#include <libhostlink/diagnostics.hxx>

namespace hostlink
{
  namespace
  {
    void
    run (scheduled_task& t)
    {
      exception_ptr e;

      try
      {
        t.action ();
      }
      catch (...)
      {
        e = std::current_exception ();
      }

      if (t.completion)
      {
        try
        {
          t.completion (e);
        }
        catch (...)
        {
          cerr << "error: idle task completion failed: "
               << describe (std::current_exception ()) << endl;
        }
      }
      else if (e != nullptr)
      {
        cerr << "error: idle task failed: " << describe (e) << endl;
      }
    }
  }

  idle_scheduler::idle_scheduler (utility::scheduler& s, string n)
    : sched_ (s),
      strand_ (move (n))
  {
    sched_.register_strand (strand_);
  }

  idle_scheduler::~idle_scheduler ()
  {
    // Unregistering from inside our own poll would pull the io_context out
    // from under the running task.
    //
    if (sched_.is_registered (strand_) && !sched_.running_in (strand_))
      sched_.unregister_strand (strand_);
  }

  void
  idle_scheduler::schedule_for_execution (scheduled_task t)
  {
    if (!t.action)
      throw invalid_argument ("scheduled task has no action");

    sched_.post (strand_, [t = move (t)] () mutable {run (t);});
  }

  void
  idle_scheduler::poll ()
  {
    sched_.poll (strand_);
  }

  bool
  idle_scheduler::in_idle_context () const
  {
    return sched_.running_in (strand_);
  }

  void
  idle_scheduler::require_idle_context (const string& o) const
  {
    if (!in_idle_context ())
      throw idle_affinity_error (o);
  }

  bool
  idle_scheduler::has_pending () const
  {
    return sched_.has_pending (strand_);
  }
}
