#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <stdexcept>
#include <vector>

#include "StatUtils.h"

using culturebench::StatUtils;
using Catch::Approx;

TEST_CASE("StatUtils::computeMean", "[StatUtils]")
{
  SECTION("Basic mean")
    {
      REQUIRE(StatUtils::computeMean({1.0, 2.0, 3.0, 4.0}) == Approx(2.5));
    }

  SECTION("Empty series")
    {
      REQUIRE(StatUtils::computeMean({}) == 0.0);
    }

  SECTION("Single value")
    {
      REQUIRE(StatUtils::computeMean({5.0}) == 5.0);
    }
}

TEST_CASE("StatUtils::quantileType7", "[StatUtils]")
{
  const std::vector<double> sorted = {1.0, 2.0, 3.0, 4.0, 5.0};

  SECTION("Endpoints")
    {
      REQUIRE(StatUtils::quantileType7Sorted(sorted, 0.0) == 1.0);
      REQUIRE(StatUtils::quantileType7Sorted(sorted, 1.0) == 5.0);
    }

  SECTION("Order statistics")
    {
      REQUIRE(StatUtils::quantileType7Sorted(sorted, 0.5) == Approx(3.0));
      REQUIRE(StatUtils::quantileType7Sorted(sorted, 0.25) == Approx(2.0));
    }

  SECTION("Linear interpolation between order statistics")
    {
      // h = 4 * 0.1 = 0.4
      REQUIRE(StatUtils::quantileType7Sorted(sorted, 0.1) == Approx(1.4));
      // h = 4 * 0.975 = 3.9
      REQUIRE(StatUtils::quantileType7Sorted(sorted, 0.975) == Approx(4.9));
      REQUIRE(StatUtils::quantileType7Sorted({10.0, 20.0}, 0.025) == Approx(10.25));
    }

  SECTION("Unsorted input")
    {
      REQUIRE(StatUtils::quantileType7({5.0, 1.0, 4.0, 2.0, 3.0}, 0.1) == Approx(1.4));
    }

  SECTION("Single value")
    {
      REQUIRE(StatUtils::quantileType7Sorted({7.0}, 0.3) == 7.0);
    }

  SECTION("Empty input throws")
    {
      REQUIRE_THROWS_AS(StatUtils::quantileType7Sorted({}, 0.5), std::invalid_argument);
    }
}
