#pragma once

#include <future>
#include <functional>
#include <vector>

namespace benchstat
{
  namespace concurrency
  {
    /**
     * @brief Abstract task-submission policy used by the parallel loops.
     *
     * Implementations decide where a task runs (inline, on a fresh thread,
     * on a pool worker). Exceptions thrown by a task are captured in the
     * returned future and rethrown by waitAll().
     */
    class IParallelExecutor
    {
    public:
      virtual ~IParallelExecutor() = default;

      virtual std::future<void> submit(std::function<void()> task) = 0;

      /**
       * @brief Block until every future completes.
       *
       * All futures are drained before the first captured exception is
       * rethrown, so no task is left running against released state.
       */
      void waitAll(std::vector<std::future<void>>& futures)
      {
        std::exception_ptr firstError;
        for (auto& f : futures)
          {
            try
              {
                f.get();
              }
            catch (...)
              {
                if (!firstError)
                  firstError = std::current_exception();
              }
          }

        if (firstError)
          std::rethrow_exception(firstError);
      }
    };
  } // namespace concurrency
} // namespace benchstat
