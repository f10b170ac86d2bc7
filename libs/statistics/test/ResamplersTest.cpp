#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

#include "IIDResampler.h"
#include "RngUtils.h"

using culturebench::resampling::IIDResampler;
using culturebench::rng_utils::CRNEngineProvider;
using culturebench::rng_utils::CRNKey;

TEST_CASE("IIDResampler draws from the source", "[Resampler]")
{
  const std::vector<double> x = {1.0, 2.0, 3.0, 4.0, 5.0};
  IIDResampler res;
  std::mt19937_64 rng(31);
  std::vector<double> y;

  res(x, y, 200, rng);

  REQUIRE(y.size() == 200);
  for (double v : y)
    REQUIRE(std::find(x.begin(), x.end(), v) != x.end());

  // With 200 draws from 5 values every value shows up
  for (double v : x)
    REQUIRE(std::find(y.begin(), y.end(), v) != y.end());
}

TEST_CASE("IIDResampler is reproducible with the same engine", "[Resampler]")
{
  const std::vector<double> x = {4.0, 1.0, 5.0, 2.0, 2.0, 3.0};
  IIDResampler res;
  CRNEngineProvider<> provider(CRNKey(42));

  std::vector<double> y1, y2;
  auto rng1 = provider.make_engine(9);
  auto rng2 = provider.make_engine(9);
  res(x, y1, x.size(), rng1);
  res(x, y2, x.size(), rng2);

  REQUIRE(y1 == y2);
}

TEST_CASE("IIDResampler rejects empty input", "[Resampler]")
{
  IIDResampler res;
  std::mt19937_64 rng(1);
  std::vector<double> y;
  const std::vector<double> empty;
  REQUIRE_THROWS_AS(res(empty, y, 3, rng), std::invalid_argument);
}
