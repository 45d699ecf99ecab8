#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

#include "IParallelExecutor.h"

/**
 * @file ParallelExecutors.h
 * @brief Executor policies for the bootstrap shard loop.
 *
 *  - SingleThreadExecutor: runs each task inline on the calling thread.
 *  - StdAsyncExecutor: one std::async(std::launch::async) call per task.
 *  - ThreadPoolExecutor<N>: fixed pool of N workers fed from a shared queue.
 *
 * The choice of executor never changes numerical results of the estimators in
 * this project: work is partitioned by index, not by worker, so only wall
 * time differs between policies.
 */
namespace benchstat
{
  namespace concurrency
  {
    /**
     * @brief Executes tasks synchronously on the calling thread.
     */
    class SingleThreadExecutor : public IParallelExecutor
    {
    public:
      std::future<void> submit(std::function<void()> task) override
      {
        std::promise<void> prom;
        auto fut = prom.get_future();
        try
          {
            task();
            prom.set_value();
          }
        catch (...)
          {
            prom.set_exception(std::current_exception());
          }
        return fut;
      }
    };

    /**
     * @brief Launches every task with std::async(std::launch::async).
     *
     * Suited to a handful of long shards; thread start-up cost dominates for
     * many small tasks.
     */
    class StdAsyncExecutor : public IParallelExecutor
    {
    public:
      std::future<void> submit(std::function<void()> task) override
      {
        return std::async(std::launch::async, std::move(task));
      }
    };

    /**
     * @brief Fixed-size worker pool.
     *
     * N == 0 selects std::thread::hardware_concurrency() workers (2 if the
     * runtime cannot report it).
     */
    template <std::size_t N = 0>
    class ThreadPoolExecutor : public IParallelExecutor
    {
    public:
      ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
      ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

      ThreadPoolExecutor()
        : m_stop(false)
      {
        const unsigned hw = std::thread::hardware_concurrency();
        const std::size_t threads = N > 0 ? N : (hw ? hw : 2);

        try
          {
            for (std::size_t i = 0; i < threads; ++i)
              m_workers.emplace_back([this] { workerLoop(); });
          }
        catch (...)
          {
            shutdown();
            throw;
          }
      }

      ~ThreadPoolExecutor()
      {
        shutdown();
      }

      std::future<void> submit(std::function<void()> task) override
      {
        auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
        auto fut = packaged->get_future();
        {
          std::lock_guard<std::mutex> lock(m_queueMutex);
          if (m_stop)
            throw std::runtime_error("ThreadPoolExecutor: submit on stopped pool");
          m_tasks.emplace([packaged]() { (*packaged)(); });
        }
        m_condition.notify_one();
        return fut;
      }

      std::size_t numWorkers() const noexcept
      {
        return m_workers.size();
      }

    private:
      void workerLoop()
      {
        for (;;)
          {
            std::function<void()> task;
            {
              std::unique_lock<std::mutex> lock(m_queueMutex);
              m_condition.wait(lock, [this] { return m_stop || !m_tasks.empty(); });
              if (m_stop && m_tasks.empty())
                return;
              task = std::move(m_tasks.front());
              m_tasks.pop();
            }
            task();
          }
      }

      void shutdown()
      {
        {
          std::lock_guard<std::mutex> lock(m_queueMutex);
          m_stop = true;
        }
        m_condition.notify_all();
        for (auto& worker : m_workers)
          {
            if (worker.joinable())
              worker.join();
          }
      }

    private:
      std::vector<std::thread>          m_workers;
      std::queue<std::function<void()>> m_tasks;
      std::mutex                        m_queueMutex;
      std::condition_variable           m_condition;
      bool                              m_stop;
    };
  } // namespace concurrency
} // namespace benchstat
