#pragma once

#include <algorithm>
#include <cstdint>
#include <future>
#include <thread>
#include <vector>

namespace concurrency
{
  namespace detail
  {
    inline unsigned defaultTaskCount()
    {
      const unsigned hw = std::thread::hardware_concurrency();
      return hw ? hw : 2;
    }

    template<typename Executor, typename Body>
    void run_chunks(uint32_t total, uint32_t chunkSize, Executor& exec, Body& body)
    {
      std::vector<std::future<void>> futures;
      futures.reserve((total + chunkSize - 1) / chunkSize);

      for (uint32_t start = 0; start < total; start += chunkSize) {
	const uint32_t end = std::min(total, start + chunkSize);
	futures.emplace_back(exec.submit([&body, start, end]() {
	  for (uint32_t i = start; i < end; ++i)
	    body(i);
	}));
      }
      exec.waitAll(futures);
    }
  }

  // Split [0, total) into at most hardware_concurrency chunks and run body(i)
  // for every index. Blocks until all chunks finish.
  template<typename Executor, typename Body>
  void parallel_for(uint32_t total, Executor& exec, Body body)
  {
    if (total == 0)
      return;

    const unsigned numTasks = detail::defaultTaskCount();
    const uint32_t chunkSize = (total + numTasks - 1) / numTasks;
    detail::run_chunks(total, chunkSize, exec, body);
  }

  // As parallel_for, but the caller may fix the chunk size. A hint of 0
  // falls back to roughly four chunks per hardware thread, which keeps a
  // pool busy when replicate costs vary.
  template<typename Executor, typename Body>
  void parallel_for_chunked(uint32_t total, Executor& exec, Body body, uint32_t chunkSizeHint = 0)
  {
    if (total == 0)
      return;

    uint32_t chunkSize = chunkSizeHint;
    if (chunkSize == 0) {
      const uint32_t target = detail::defaultTaskCount() * 4u;
      chunkSize = std::max<uint32_t>(1u, (total + target - 1) / target);
    }
    detail::run_chunks(total, chunkSize, exec, body);
  }
} // namespace concurrency
