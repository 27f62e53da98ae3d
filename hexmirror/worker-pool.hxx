// file      : hexmirror/worker-pool.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef HEXMIRROR_WORKER_POOL_HXX
#define HEXMIRROR_WORKER_POOL_HXX

#include <exception> // exception_ptr, current_exception(), rethrow_exception()

#include <hexmirror/types.hxx>
#include <hexmirror/utility.hxx>

#include <hexmirror/diagnostics.hxx>

namespace hexmirror
{
  // Fixed-size pool of worker threads processing a batch of tasks.
  //
  // The tasks are handed out in order through the shared queue position so
  // that a worker that is done with its task picks the next pending one. The
  // result of each task is stored into its own slot (so no synchronization
  // is required for the results) and the results are returned in the task
  // order once all the workers have joined.
  //
  // If the task function throws, then no further tasks are started, the
  // tasks already in progress are completed, and the exception of the
  // earliest (in the task order) failed task is rethrown to the caller.
  //
  // The result type must be default-constructible.
  //
  template <typename T, typename R>
  class worker_pool
  {
  public:
    using task_type = T;
    using result_type = R;
    using function_type = function<R (const T&, size_t index)>;

    worker_pool (size_t jobs, function_type f)
        : jobs_ (jobs != 0 ? jobs : 1), function_ (move (f)) {}

    size_t
    jobs () const {return jobs_;}

    vector<R>
    run (const vector<T>& tasks) const
    {
      size_t n (tasks.size ());

      vector<R> results (n);
      vector<std::exception_ptr> errors (n);

      atomic<size_t> next (0);
      atomic<bool> stop (false);

      auto worker = [&tasks, &results, &errors, &next, &stop, n, this] ()
      {
        for (size_t i;
             !stop.load (std::memory_order_acquire) &&
               (i = next.fetch_add (1, std::memory_order_relaxed)) < n; )
        {
          try
          {
            results[i] = function_ (tasks[i], i);
          }
          catch (...)
          {
            errors[i] = std::current_exception ();
            stop.store (true, std::memory_order_release);
          }
        }
      };

      vector<thread> threads;
      size_t tn (std::min (jobs_, n));
      threads.reserve (tn);

      try
      {
        for (size_t i (0); i != tn; ++i)
          threads.emplace_back (worker);
      }
      catch (const system_error& e)
      {
        stop.store (true, std::memory_order_release);

        for (thread& t: threads)
          t.join ();

        fail << "unable to start worker thread: " << e;
      }

      for (thread& t: threads)
        t.join ();

      for (const std::exception_ptr& e: errors)
      {
        if (e != nullptr)
          std::rethrow_exception (e);
      }

      return results;
    }

  private:
    size_t jobs_;
    function_type function_;
  };
}

#endif // HEXMIRROR_WORKER_POOL_HXX
