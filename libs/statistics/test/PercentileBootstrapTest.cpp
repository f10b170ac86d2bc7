// Unit tests for PercentileBootstrap with the i.i.d. resampler and CRN engines.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

#include "IIDResampler.h"
#include "ParallelExecutors.h"
#include "PercentileBootstrap.h"
#include "RngUtils.h"
#include "StatUtils.h"

using culturebench::analysis::PercentileBootstrap;
using culturebench::resampling::IIDResampler;
using culturebench::rng_utils::CRNEngineProvider;
using culturebench::rng_utils::CRNKey;
using culturebench::StatUtils;
using Catch::Approx;

namespace
{
  struct MeanSampler
  {
    double operator()(const std::vector<double>& x) const
    {
      return StatUtils::computeMean(x);
    }
  };

  // Returns NaN for every resample whose first element is 1.0
  struct SometimesNaNSampler
  {
    double operator()(const std::vector<double>& x) const
    {
      if (!x.empty() && x.front() == 1.0)
	return std::numeric_limits<double>::quiet_NaN();
      return StatUtils::computeMean(x);
    }
  };

  std::vector<double> rampData(std::size_t n)
  {
    std::vector<double> x(n);
    for (std::size_t i = 0; i < n; ++i)
      x[i] = static_cast<double>(i % 5) + 1.0;
    return x;
  }
}

TEST_CASE("PercentileBootstrap constructor validation", "[PercentileBootstrap]")
{
  IIDResampler res;
  using PB = PercentileBootstrap<MeanSampler, IIDResampler>;

  REQUIRE_THROWS_AS(PB(0, 0.95, res), std::invalid_argument);
  REQUIRE_THROWS_AS(PB(100, 0.0, res), std::invalid_argument);
  REQUIRE_THROWS_AS(PB(100, 1.0, res), std::invalid_argument);
  REQUIRE_THROWS_AS(PB(100, 0.95, res, nullptr), std::invalid_argument);
  REQUIRE_NOTHROW(PB(100, 0.95, res));
}

TEST_CASE("PercentileBootstrap basic interval", "[PercentileBootstrap]")
{
  const auto x = rampData(50);
  PercentileBootstrap<MeanSampler, IIDResampler> pb(1000, 0.95, IIDResampler());
  CRNEngineProvider<> provider(CRNKey(42));

  const auto r = pb.run(x, MeanSampler(), provider);

  REQUIRE(r.estimate == Approx(3.0));
  REQUIRE(r.lower <= r.estimate);
  REQUIRE(r.estimate <= r.upper);
  REQUIRE(r.lower < r.upper);
  REQUIRE(r.B == 1000);
  REQUIRE(r.effective_B == 1000);
  REQUIRE(r.skipped == 0);
  REQUIRE(r.n == 50);
  REQUIRE(r.cl == 0.95);
}

TEST_CASE("PercentileBootstrap degenerate samples", "[PercentileBootstrap]")
{
  PercentileBootstrap<MeanSampler, IIDResampler> pb(500, 0.95, IIDResampler());
  CRNEngineProvider<> provider(CRNKey(42));

  SECTION("Empty")
    {
      const auto r = pb.run({}, MeanSampler(), provider);
      REQUIRE(r.estimate == 0.0);
      REQUIRE(r.lower == 0.0);
      REQUIRE(r.upper == 0.0);
      REQUIRE(r.effective_B == 0);
    }

  SECTION("One observation")
    {
      const auto r = pb.run({2.5}, MeanSampler(), provider);
      REQUIRE(r.estimate == 2.5);
      REQUIRE(r.lower == 2.5);
      REQUIRE(r.upper == 2.5);
      REQUIRE(r.n == 1);
    }
}

TEST_CASE("PercentileBootstrap result does not depend on the executor", "[PercentileBootstrap][Concurrency]")
{
  const auto x = rampData(37);
  CRNEngineProvider<> provider(CRNKey(2024));

  PercentileBootstrap<MeanSampler, IIDResampler> serial(800, 0.90, IIDResampler());
  PercentileBootstrap<MeanSampler, IIDResampler, std::mt19937_64,
		      concurrency::ThreadPoolExecutor<3>> pooled(800, 0.90, IIDResampler());

  const auto a = serial.run(x, MeanSampler(), provider);
  const auto b = pooled.run(x, MeanSampler(), provider);

  REQUIRE(a.lower == b.lower);
  REQUIRE(a.upper == b.upper);
  REQUIRE(a.effective_B == b.effective_B);
}

TEST_CASE("PercentileBootstrap drops non-finite replicates", "[PercentileBootstrap]")
{
  // About one in five resamples starts with 1.0 and is discarded
  const auto x = rampData(25);
  PercentileBootstrap<SometimesNaNSampler, IIDResampler> pb(400, 0.95, IIDResampler());
  CRNEngineProvider<> provider(CRNKey(99));

  const auto r = pb.run(x, SometimesNaNSampler(), provider);
  REQUIRE(r.skipped > 0);
  REQUIRE(r.effective_B + r.skipped == 400);
  REQUIRE(r.lower <= r.upper);
}

TEST_CASE("PercentileBootstrap throws when most replicates are degenerate", "[PercentileBootstrap]")
{
  struct AlwaysNaN
  {
    double operator()(const std::vector<double>&) const
    {
      return std::numeric_limits<double>::quiet_NaN();
    }
  };

  PercentileBootstrap<AlwaysNaN, IIDResampler> pb(100, 0.95, IIDResampler());
  CRNEngineProvider<> provider(CRNKey(1));
  const std::vector<double> x = {1.0, 2.0, 3.0};

  REQUIRE_THROWS_AS(pb.run(x, AlwaysNaN(), provider), std::runtime_error);
}
