#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <optional>
#include <string>
#include <vector>

#include "KrippendorffAlpha.h"
#include "ReliabilityMatrix.h"

using namespace culturebench::agreement;
using Catch::Approx;

namespace
{
  using Row = std::vector<std::optional<double>>;

  ReliabilityMatrix makeMatrix(const std::vector<Row>& rows)
  {
    std::vector<std::string> annotators;
    for (std::size_t i = 0; i < rows.size(); ++i)
      annotators.push_back("rater" + std::to_string(i));

    std::vector<UnitKey> units;
    const std::size_t numUnits = rows.empty() ? 0 : rows.front().size();
    for (std::size_t u = 0; u < numUnits; ++u)
      units.push_back(UnitKey{"p" + std::to_string(u)});

    return ReliabilityMatrix(annotators, units, rows);
  }

  const std::optional<double> NA = std::nullopt;

  // Krippendorff (2011), "Computing Krippendorff's Alpha-Reliability", 4 observers x 12 units
  std::vector<Row> publishedExample()
  {
    return {
      { 1.0, 2.0, 3.0, 3.0, 2.0, 1.0, 4.0, 1.0, 2.0, NA,  NA,  NA  },
      { 1.0, 2.0, 3.0, 3.0, 2.0, 2.0, 4.0, 1.0, 2.0, 5.0, NA,  3.0 },
      { NA,  3.0, 3.0, 3.0, 2.0, 3.0, 4.0, 2.0, 2.0, 5.0, 1.0, NA  },
      { 1.0, 2.0, 3.0, 3.0, 2.0, 4.0, 4.0, 1.0, 2.0, 5.0, 1.0, NA  }
    };
  }
}

TEST_CASE("KrippendorffAlpha reproduces the published reliability example", "[KrippendorffAlpha]")
{
  const auto matrix = makeMatrix(publishedExample());

  SECTION("Nominal")
    {
      const AlphaResult r = KrippendorffAlpha(MeasurementLevel::Nominal).compute(matrix);
      REQUIRE(r.isDefined());
      REQUIRE(*r.alpha == Approx(0.743421052631579).margin(1e-9));
      REQUIRE(r.pairableUnits == 11);
      REQUIRE(r.pairableValues == 40);
    }

  SECTION("Ordinal")
    {
      const auto alpha = krippendorffAlpha(matrix, MeasurementLevel::Ordinal);
      REQUIRE(alpha.has_value());
      REQUIRE(*alpha == Approx(0.8153875037548814).margin(1e-9));
    }

  SECTION("Interval")
    {
      const auto alpha = krippendorffAlpha(matrix, MeasurementLevel::Interval);
      REQUIRE(alpha.has_value());
      REQUIRE(*alpha == Approx(0.8491071428571428).margin(1e-9));
    }
}

TEST_CASE("KrippendorffAlpha marginal policy", "[KrippendorffAlpha]")
{
  SECTION("AllValues pools the singleton unit of the published example")
    {
      const auto matrix = makeMatrix(publishedExample());

      const auto nominal = KrippendorffAlpha(MeasurementLevel::Nominal,
					     MarginalPolicy::AllValues).compute(matrix);
      const auto ordinal = KrippendorffAlpha(MeasurementLevel::Ordinal,
					     MarginalPolicy::AllValues).compute(matrix);

      REQUIRE(*nominal.alpha == Approx(0.74294670846395).margin(1e-9));
      REQUIRE(*ordinal.alpha == Approx(0.8131200396825398).margin(1e-9));
    }

  SECTION("Policies differ only when a unit is rated once")
    {
      const auto matrix = makeMatrix({ { 1.0, 2.0, 5.0 },
				       { 1.0, 3.0, NA  } });

      const auto pairable = KrippendorffAlpha(MeasurementLevel::Ordinal).compute(matrix);
      const auto all = KrippendorffAlpha(MeasurementLevel::Ordinal,
					 MarginalPolicy::AllValues).compute(matrix);

      REQUIRE(*pairable.alpha == Approx(0.8333333333333334).margin(1e-9));
      REQUIRE(*all.alpha == Approx(0.8947368421052632).margin(1e-9));
      REQUIRE(pairable.observedDisagreement == Approx(all.observedDisagreement));
    }

  SECTION("Default policy is PairableOnly")
    {
      KrippendorffAlpha calc(MeasurementLevel::Nominal);
      REQUIRE(calc.getPolicy() == MarginalPolicy::PairableOnly);
      REQUIRE(calc.getLevel() == MeasurementLevel::Nominal);
    }
}

TEST_CASE("KrippendorffAlpha perfect agreement", "[KrippendorffAlpha]")
{
  SECTION("Two annotators both scoring 4 on one unit")
    {
      const auto matrix = makeMatrix({ { 4.0 }, { 4.0 } });
      REQUIRE(*krippendorffAlpha(matrix, MeasurementLevel::Ordinal) == 1.0);
    }

  SECTION("A single distinct value everywhere is 1 for every metric")
    {
      const auto matrix = makeMatrix({ { 3.0, 3.0, NA  },
				       { 3.0, 3.0, 3.0 },
				       { NA,  3.0, 3.0 } });

      REQUIRE(*krippendorffAlpha(matrix, MeasurementLevel::Nominal) == 1.0);
      REQUIRE(*krippendorffAlpha(matrix, MeasurementLevel::Ordinal) == 1.0);
      REQUIRE(*krippendorffAlpha(matrix, MeasurementLevel::Interval) == 1.0);
    }

  SECTION("Identical varied ratings")
    {
      const auto matrix = makeMatrix({ { 1.0, 2.0, 3.0, 5.0 },
				       { 1.0, 2.0, 3.0, 5.0 } });
      REQUIRE(*krippendorffAlpha(matrix, MeasurementLevel::Ordinal) == Approx(1.0));
      REQUIRE(*krippendorffAlpha(matrix, MeasurementLevel::Nominal) == Approx(1.0));
    }
}

TEST_CASE("KrippendorffAlpha systematic disagreement", "[KrippendorffAlpha]")
{
  const auto matrix = makeMatrix({ { 5.0, 1.0 },
				   { 1.0, 5.0 } });

  const AlphaResult r = KrippendorffAlpha(MeasurementLevel::Ordinal).compute(matrix);
  REQUIRE(r.isDefined());
  REQUIRE(r.observedDisagreement == Approx(4.0));
  REQUIRE(r.expectedDisagreement == Approx(8.0 / 3.0));
  REQUIRE(*r.alpha == Approx(-0.5));
  REQUIRE(*r.alpha < 0.0);
}

TEST_CASE("KrippendorffAlpha ordinal distance follows marginal frequencies", "[KrippendorffAlpha]")
{
  SECTION("Small two-annotator example")
    {
      const auto matrix = makeMatrix({ { 1.0, 2.0, 3.0, 1.0 },
				       { 1.0, 2.0, 3.0, 2.0 } });
      REQUIRE(*krippendorffAlpha(matrix, MeasurementLevel::Ordinal) == Approx(0.79).margin(1e-9));
      REQUIRE(*krippendorffAlpha(matrix, MeasurementLevel::Nominal) == Approx(2.0 / 3.0).margin(1e-9));
    }

  SECTION("Nominal alpha is invariant under relabeling")
    {
      const auto original = makeMatrix({ { 1.0, 2.0, 3.0, 1.0 },
					 { 1.0, 2.0, 3.0, 2.0 } });
      const auto relabeled = makeMatrix({ { 7.0, 9.0, 8.0, 7.0 },
					  { 7.0, 9.0, 8.0, 9.0 } });

      REQUIRE(*krippendorffAlpha(original, MeasurementLevel::Nominal) ==
	      Approx(*krippendorffAlpha(relabeled, MeasurementLevel::Nominal)));
    }

  SECTION("Ordinal alpha changes under an order-changing relabeling")
    {
      // relabeling 1->3, 2->1, 3->4, 4->2
      const auto original = makeMatrix({ { 1.0, 2.0, 3.0, 1.0, 4.0 },
					 { 1.0, 2.0, 3.0, 2.0, 3.0 } });
      const auto relabeled = makeMatrix({ { 3.0, 1.0, 4.0, 3.0, 2.0 },
					  { 3.0, 1.0, 4.0, 1.0, 4.0 } });

      const double ordOriginal = *krippendorffAlpha(original, MeasurementLevel::Ordinal);
      const double ordRelabeled = *krippendorffAlpha(relabeled, MeasurementLevel::Ordinal);

      REQUIRE(ordOriginal == Approx(0.8470588235294118).margin(1e-9));
      REQUIRE(ordRelabeled == Approx(0.5176470588235295).margin(1e-9));
      REQUIRE(ordOriginal != Approx(ordRelabeled));

      REQUIRE(*krippendorffAlpha(original, MeasurementLevel::Nominal) == Approx(0.5));
      REQUIRE(*krippendorffAlpha(relabeled, MeasurementLevel::Nominal) == Approx(0.5));
    }
}

TEST_CASE("KrippendorffAlpha insufficient data", "[KrippendorffAlpha]")
{
  SECTION("No matrix")
    {
      const std::optional<ReliabilityMatrix> none;
      REQUIRE_FALSE(krippendorffAlpha(none, MeasurementLevel::Nominal).has_value());
    }

  SECTION("Single annotator")
    {
      const auto matrix = makeMatrix({ { 1.0, 2.0, 3.0 } });
      const AlphaResult r = KrippendorffAlpha(MeasurementLevel::Ordinal).compute(matrix);
      REQUIRE_FALSE(r.isDefined());
      REQUIRE(r.pairableUnits == 0);
    }

  SECTION("No unit rated by two annotators")
    {
      const auto matrix = makeMatrix({ { 1.0, NA,  3.0 },
				       { NA,  2.0, NA  } });
      REQUIRE_FALSE(krippendorffAlpha(matrix, MeasurementLevel::Nominal).has_value());
    }

  SECTION("Builder with fewer than two annotators")
    {
      ReliabilityMatrixBuilder builder;
      builder.addRating("ann1", {"p1", "m1"}, 4.0);
      builder.addRating("ann1", {"p2", "m1"}, 5.0);
      REQUIRE_FALSE(krippendorffAlpha(builder.build(), MeasurementLevel::Ordinal).has_value());
    }
}

TEST_CASE("MeasurementLevel names", "[KrippendorffAlpha]")
{
  REQUIRE(toString(MeasurementLevel::Nominal) == "nominal");
  REQUIRE(toString(MeasurementLevel::Ordinal) == "ordinal");
  REQUIRE(toString(MeasurementLevel::Interval) == "interval");
}
