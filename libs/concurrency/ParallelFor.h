#pragma once

#include <algorithm>
#include <cstdint>
#include <future>
#include <thread>
#include <vector>

namespace benchstat
{
  namespace concurrency
  {
    /**
     * @brief Split [0, total) into contiguous chunks, submit each chunk to the
     * executor and wait for all of them.
     *
     * With chunkSizeHint == 0 the chunk size is chosen so that each worker
     * receives a few chunks, never fewer than kMinAutoChunk iterations per
     * chunk. A non-zero hint is used verbatim.
     */
    template<typename Executor, typename Body>
    void parallel_for_chunked(uint32_t total, Executor& exec, Body body,
                              uint32_t chunkSizeHint = 0)
    {
      constexpr uint32_t kMinAutoChunk = 512;
      constexpr unsigned kChunksPerWorker = 4;

      if (total == 0)
        return;

      uint32_t chunkSize = chunkSizeHint;
      if (chunkSize == 0)
        {
          const unsigned hw = std::thread::hardware_concurrency();
          const unsigned workers = hw ? hw : 2;
          const uint32_t target = workers * kChunksPerWorker;
          chunkSize = std::max(kMinAutoChunk, (total + target - 1) / target);
        }

      std::vector<std::future<void>> futures;
      futures.reserve((total + chunkSize - 1) / chunkSize);
      for (uint32_t start = 0; start < total; start += chunkSize)
        {
          const uint32_t end = std::min(total, start + chunkSize);
          futures.emplace_back(exec.submit([=]() {
            for (uint32_t i = start; i < end; ++i)
              body(i);
          }));
        }
      exec.waitAll(futures);
    }
  } // namespace concurrency
} // namespace benchstat
