#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <libhostlink/utility/export.hxx>

namespace hostlink
{
  namespace utility
  {
    // Strand-based task scheduler for serialized execution contexts.
    //
    // Each strand owns its own io_context so that polling one strand never
    // runs work queued on another. Tasks posted to a strand execute in
    // submission order and only from within poll() on that strand. Posting is
    // safe from any thread; polling a given strand is expected to happen on a
    // single thread (the host thread that owns the context).
    //
    class LIBHOSTLINK_UTILITY_SYMEXPORT scheduler
    {
    public:
      using strand_type =
        boost::asio::strand<boost::asio::io_context::executor_type>;

      scheduler ();
      ~scheduler ();

      scheduler (const scheduler&) = delete;
      scheduler& operator= (const scheduler&) = delete;

      // Register a new strand with the given name.
      //
      // Strand names must be unique. Throws std::invalid_argument if the
      // name is empty or already registered.
      //
      void
      register_strand (const std::string& name);

      // Unregister a strand, discarding any pending tasks.
      //
      // Throws std::invalid_argument if the strand is not registered.
      //
      void
      unregister_strand (const std::string& name);

      // Poll one strand, executing every ready task in submission order.
      //
      // This is non-blocking. While it runs, running_in() for this strand
      // returns true on the calling thread. A nested poll of the same strand
      // from within one of its tasks returns immediately.
      //
      // If a task throws, the exception propagates out of poll() and the
      // remaining tasks stay queued for the next poll.
      //
      // Throws std::invalid_argument if the strand is not registered.
      //
      void
      poll (const std::string& name);

      // Post a task to the specified strand.
      //
      // The task is enqueued and will execute when the strand is polled.
      // Throws std::invalid_argument if the strand is not registered.
      //
      template <typename F>
      void
      post (const std::string& strand_name, F&& function)
      {
        enqueue_task (strand_name,
                      std::function<void ()> (static_cast<F&&> (function)));
      }

      // Check if a strand has tasks that have not started yet.
      //
      // Throws std::invalid_argument if the strand is not registered.
      //
      bool
      has_pending (const std::string& name) const;

      // Check if a strand is registered.
      //
      bool
      is_registered (const std::string& name) const;

      // Check if the calling thread is currently inside poll() of the named
      // strand.
      //
      bool
      running_in (const std::string& name) const;

    private:
      struct strand
      {
        std::string name;
        std::uint64_t hash;
        boost::asio::io_context context;
        strand_type executor;
        std::atomic<std::size_t> pending;

        explicit
        strand (const std::string& strand_name);

        strand (const strand&) = delete;
        strand& operator= (const strand&) = delete;
      };

      std::unordered_map<std::uint64_t, std::unique_ptr<strand>> strands_;
      mutable std::mutex registry_mutex_;

      void
      enqueue_task (const std::string& name, std::function<void ()>);

      strand*
      find_strand (std::uint64_t hash) noexcept;

      const strand*
      find_strand (std::uint64_t hash) const noexcept;

      void
      process_tasks (strand&);
    };
  }
}
