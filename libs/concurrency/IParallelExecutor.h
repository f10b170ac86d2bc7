#pragma once

#include <exception>
#include <functional>
#include <future>
#include <vector>

namespace concurrency
{
  /**
   * @brief Minimal task-submission interface used by the statistics engine.
   *
   * Bootstrap replicates and per-dimension agreement computations are
   * independent pure functions, so any executor that can run a void() task
   * and hand back a future is sufficient.
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Waits on every future, then rethrows the first stored exception.
    // Never returns early, so tasks referencing caller state have finished.
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      std::exception_ptr first;
      for (auto& f : futures) {
	try {
	  f.get();
	}
	catch (...) {
	  if (!first)
	    first = std::current_exception();
	}
      }
      if (first)
	std::rethrow_exception(first);
    }
  };
}
