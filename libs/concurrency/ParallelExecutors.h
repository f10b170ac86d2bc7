#pragma once

#include <condition_variable>
#include <cstddef>
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
 * @brief Executor policies for fanning out independent statistics work.
 *
 *  - SingleThreadExecutor: runs every task inline. This is the canonical,
 *    fully deterministic mode and the default everywhere in culturebench.
 *  - ThreadPoolExecutor<N>: fixed pool of N workers (N == 0 picks the hardware
 *    concurrency). Suitable for many small tasks such as chunks of bootstrap
 *    replicates.
 *
 * Results never depend on the executor choice: callers derive their random
 * streams from replicate indices, not from scheduling order.
 */
namespace concurrency
{
  class SingleThreadExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try {
	task();
	prom.set_value();
      }
      catch (...) {
	prom.set_exception(std::current_exception());
      }
      return fut;
    }
  };

  /**
   * @brief Fixed-size worker pool.
   *
   * Tasks are queued FIFO. Exceptions thrown by a task are stored in the
   * returned future. Destruction drains the queue before joining.
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
      : ThreadPoolExecutor(N)
    {}

    // numThreads == 0 picks the hardware concurrency.
    explicit ThreadPoolExecutor(std::size_t numThreads)
      : stop_(false)
    {
      const std::size_t hw = std::thread::hardware_concurrency();
      const std::size_t threads = numThreads > 0 ? numThreads : (hw ? hw : 2);

      try {
	for (std::size_t i = 0; i < threads; ++i)
	  workers_.emplace_back([this] { workerLoop(); });
      }
      catch (...) {
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
	std::unique_lock<std::mutex> lock(tasksMutex_);
	if (stop_)
	  throw std::runtime_error("ThreadPoolExecutor: submit on stopped pool");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

    std::size_t numThreads() const noexcept
    {
      return workers_.size();
    }

  private:
    void workerLoop()
    {
      for (;;) {
	std::function<void()> task;
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
	  if (stop_ && tasks_.empty())
	    return;
	  task = std::move(tasks_.front());
	  tasks_.pop();
	}
	task();
      }
    }

    void shutdown()
    {
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	stop_ = true;
      }
      condition_.notify_all();
      for (auto& w : workers_)
	if (w.joinable())
	  w.join();
    }

  private:
    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };
} // namespace concurrency
