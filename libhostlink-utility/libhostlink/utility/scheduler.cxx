#include <libhostlink/utility/scheduler.hxx>

#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>

#include <xxhash.h>

using namespace std;

namespace hostlink
{
  namespace utility
  {
    namespace
    {
      // Strand currently being drained on this thread, if any.
      //
      thread_local const void* draining (nullptr);

      // Strands are keyed by the XXH64 digest of their name.
      //
      inline uint64_t
      key (const string& n)
      {
        return XXH64 (n.data (), n.size (), 0);
      }
    }

    // scheduler::strand
    //

    scheduler::strand::
    strand (const string& n)
        : name (n),
          hash (key (n)),
          context (1),
          executor (boost::asio::make_strand (context)),
          pending (0)
    {
    }

    // scheduler
    //

    scheduler::
    scheduler ()
      : strands_ (), registry_mutex_ ()
    {
    }

    scheduler::
    ~scheduler ()
    {
      lock_guard<mutex> lck (registry_mutex_);
      strands_.clear ();
    }

    void scheduler::
    register_strand (const string& n)
    {
      if (n.empty ())
        throw invalid_argument ("strand name cannot be empty");

      uint64_t h (key (n));
      lock_guard<mutex> lck (registry_mutex_);

      // Check for duplicate names.
      //
      if (strands_.find (h) != strands_.end ())
        throw invalid_argument ("strand name already registered: " + n);

      strands_.emplace (h, make_unique<strand> (n));
    }

    void scheduler::
    unregister_strand (const string& n)
    {
      if (n.empty ())
        throw invalid_argument ("strand name cannot be empty");

      uint64_t h (key (n));
      lock_guard<mutex> lck (registry_mutex_);

      auto i (strands_.find (h));
      if (i == strands_.end ())
        throw invalid_argument ("strand not registered: " + n);

      if (draining == i->second.get ())
        throw invalid_argument ("strand is being polled: " + n);

      strands_.erase (i);
    }

    void scheduler::
    poll (const string& n)
    {
      strand* ctx (find_strand (key (n)));

      if (ctx == nullptr)
        throw invalid_argument ("strand not registered: " + n);

      process_tasks (*ctx);
    }

    void scheduler::
    enqueue_task (const string& n, function<void ()> f)
    {
      strand* ctx (find_strand (key (n)));

      if (ctx == nullptr)
        throw invalid_argument ("strand not registered: " + n);

      ++ctx->pending;

      boost::asio::post (ctx->executor,
                         [ctx, f = move (f)] () mutable
      {
        --ctx->pending;
        f ();
      });
    }

    bool scheduler::
    has_pending (const string& n) const
    {
      const strand* ctx (find_strand (key (n)));

      if (ctx == nullptr)
        throw invalid_argument ("strand not registered: " + n);

      return ctx->pending != 0;
    }

    bool scheduler::
    is_registered (const string& n) const
    {
      return find_strand (key (n)) != nullptr;
    }

    bool scheduler::
    running_in (const string& n) const
    {
      const strand* ctx (find_strand (key (n)));
      return ctx != nullptr && draining == ctx;
    }

    scheduler::strand* scheduler::
    find_strand (uint64_t h) noexcept
    {
      lock_guard<mutex> lck (registry_mutex_);

      auto it (strands_.find (h));
      return it != strands_.end () ? it->second.get () : nullptr;
    }

    const scheduler::strand* scheduler::
    find_strand (uint64_t h) const noexcept
    {
      lock_guard<mutex> lck (registry_mutex_);

      auto it (strands_.find (h));
      return it != strands_.end () ? it->second.get () : nullptr;
    }

    void scheduler::
    process_tasks (strand& ctx)
    {
      // The strand is already executing one of its own tasks further up the
      // stack. Running the queue here would break submission order.
      //
      if (draining == &ctx)
        return;

      // Mark the strand as draining for the duration of the poll, including
      // when a task throws.
      //
      struct marker
      {
        const void* previous;

        explicit
        marker (const strand& s)
          : previous (draining)
        {
          draining = &s;
        }

        ~marker ()
        {
          draining = previous;
        }
      };

      marker m (ctx);

      // Once all queued work has completed, io_context transitions to the
      // stopped state. Any subsequent call to poll() would then return
      // immediately without processing newly added tasks, so restart it
      // first.
      //
      if (ctx.context.stopped ())
        ctx.context.restart ();

      ctx.context.poll ();
    }
  }
}
