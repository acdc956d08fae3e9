#pragma once

#include <libhostlink/types.hxx>

#include <libhostlink/utility/scheduler.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  // Unit of deferred work.
  //
  // The completion, if present, runs right after the action on the idle
  // context and receives the exception the action threw (null on success).
  //
  struct scheduled_task
  {
    function<void ()> action;
    function<void (exception_ptr)> completion;
  };

  // Executor for work that may only touch host state from the host's idle
  // callback.
  //
  // Tasks run once, in submission order, and only from within poll(), which
  // the host integration calls on every idle tick. A task's completion runs
  // before the next task's action. A failing task never stops the ones
  // queued after it.
  //
  class LIBHOSTLINK_SYMEXPORT idle_scheduler
  {
  public:
    // Register the idle strand on the scheduler. Throws
    // std::invalid_argument if a strand with that name already exists.
    //
    explicit
    idle_scheduler (utility::scheduler&, string strand = "idle");

    ~idle_scheduler ();

    idle_scheduler (const idle_scheduler&) = delete;
    idle_scheduler& operator= (const idle_scheduler&) = delete;

    // Queue a task. Never runs it synchronously. Throws
    // std::invalid_argument if the action is empty.
    //
    void
    schedule_for_execution (scheduled_task);

    // Drain the queue. Only the host's idle callback may call this.
    //
    void
    poll ();

    // True while the calling thread is inside poll().
    //
    bool
    in_idle_context () const;

    // Throw idle_affinity_error naming the operation unless in the idle
    // context.
    //
    void
    require_idle_context (const string& operation) const;

    bool
    has_pending () const;

    const string&
    strand () const {return strand_;}

  private:
    utility::scheduler& sched_;
    string strand_;
  };
}
