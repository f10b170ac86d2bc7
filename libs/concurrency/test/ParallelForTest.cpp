#include <catch2/catch_test_macros.hpp>
#include "ParallelFor.h"
#include "ParallelExecutors.h"
#include <atomic>
#include <cstdint>
#include <numeric>
#include <vector>

using namespace concurrency;

TEST_CASE("parallel_for visits each index once", "[parallel_for]")
{
  SECTION("Single thread fills a results vector")
  {
    SingleThreadExecutor executor;
    std::vector<int> results(10, 0);

    parallel_for(10, executor, [&results](uint32_t i) { results[i] = static_cast<int>(i) * 2; });

    for (uint32_t i = 0; i < 10; ++i)
      REQUIRE(results[i] == static_cast<int>(i * 2));
  }

  SECTION("Zero iterations is a no-op")
  {
    SingleThreadExecutor executor;
    std::atomic<int> counter{0};
    parallel_for(0, executor, [&counter](uint32_t) { counter.fetch_add(1); });
    REQUIRE(counter.load() == 0);
  }

  SECTION("Thread pool touches all indices exactly once")
  {
    ThreadPoolExecutor<4> executor;
    std::vector<std::atomic<int>> visited(1000);
    for (auto& v : visited)
      v.store(0);

    parallel_for(1000, executor, [&visited](uint32_t i) {
      visited[i].fetch_add(1, std::memory_order_relaxed);
    });

    for (uint32_t i = 0; i < 1000; ++i)
      REQUIRE(visited[i].load() == 1);
  }
}

TEST_CASE("parallel_for_chunked honours chunk hints", "[parallel_for_chunked]")
{
  SECTION("Explicit chunk size larger than total")
  {
    SingleThreadExecutor executor;
    std::vector<uint32_t> seen;
    parallel_for_chunked(7, executor, [&seen](uint32_t i) { seen.push_back(i); }, 100);
    REQUIRE(seen == std::vector<uint32_t>{0, 1, 2, 3, 4, 5, 6});
  }

  SECTION("Default hint covers a bootstrap-sized range")
  {
    ThreadPoolExecutor<4> executor;
    std::vector<double> replicate(2000, -1.0);
    parallel_for_chunked(2000, executor, [&replicate](uint32_t b) {
      replicate[b] = static_cast<double>(b) * 0.5;
    });

    for (uint32_t b = 0; b < 2000; ++b)
      REQUIRE(replicate[b] == static_cast<double>(b) * 0.5);
  }

  SECTION("Same output regardless of executor")
  {
    SingleThreadExecutor serial;
    ThreadPoolExecutor<3> pool;
    std::vector<uint64_t> a(333), b(333);
    auto fill = [](std::vector<uint64_t>& out) {
      return [&out](uint32_t i) { out[i] = static_cast<uint64_t>(i) * i + 7; };
    };

    parallel_for_chunked(333, serial, fill(a), 10);
    parallel_for_chunked(333, pool, fill(b), 10);
    REQUIRE(a == b);
  }
}

