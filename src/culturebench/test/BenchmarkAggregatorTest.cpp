#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>

#include "BenchmarkFixtures.h"
#include "ParallelExecutors.h"
#include "analysis/BenchmarkAggregator.h"

using namespace culturebench;
using namespace culturebench::analysis;
using namespace culturebench::testing;
using annotation::WinnerLabel;
using Catch::Approx;

TEST_CASE("BenchmarkAggregator pairwise win rates", "[BenchmarkAggregator]")
{
    std::ostringstream log;
    BenchmarkAggregator aggregator(BenchmarkConfiguration::createDefault(), log);

    const auto results = aggregator.aggregate(lopsidedPairwise(), {});

    REQUIRE(results.models == std::vector<std::string>{"x", "y"});
    REQUIRE(results.languages == std::vector<std::string>{"igala"});
    REQUIRE(results.hasPairwise());
    REQUIRE_FALSE(results.hasRubric());

    REQUIRE(results.pairwiseByLanguage.size() == 1);
    const auto& matrix = results.pairwiseByLanguage[0].second.matrix;
    REQUIRE(*matrix.rate("x", "y") == Approx(0.75));
    REQUIRE(*matrix.rate("y", "x") == Approx(0.25));

    REQUIRE(results.pairwiseLeader);
    REQUIRE(results.pairwiseLeader->model == "x");
    REQUIRE(results.pairwiseLeader->winPercentage == Approx(75.0));

    REQUIRE(results.winRateIntervals.size() == 2);
    const auto& xInterval = results.winRateIntervals[0];
    REQUIRE(xInterval.model == "x");
    REQUIRE(xInterval.wins == 3);
    REQUIRE(xInterval.appearances == 4);
    REQUIRE(xInterval.ci.lower <= 0.75);
    REQUIRE(xInterval.ci.upper >= 0.75);
    REQUIRE(xInterval.ci.lower >= 0.0);
    REQUIRE(xInterval.ci.upper <= 1.0);

    // One annotator only
    REQUIRE_FALSE(results.pairwiseAgreement.result.isDefined());
    REQUIRE(results.pairwiseAgreement.label == "Pairwise Selection");
    REQUIRE_FALSE(results.overallRubricAlpha);
    REQUIRE(results.rubricByLanguage.empty());
}

TEST_CASE("BenchmarkAggregator rubric tables and agreement", "[BenchmarkAggregator]")
{
    std::ostringstream log;
    BenchmarkAggregator aggregator(BenchmarkConfiguration::createDefault(), log);

    const auto results = aggregator.aggregate({}, agreeingRubric());

    REQUIRE(results.languages == std::vector<std::string>{"igala", "lebanese_arabic"});
    REQUIRE(results.categories == std::vector<std::string>{"real_world_use", "words_concepts"});
    REQUIRE_FALSE(results.overallPairwise);
    REQUIRE_FALSE(results.pairwiseLeader);

    REQUIRE(results.rubricByLanguage.size() == 2);
    const auto& igala = results.rubricByLanguage[0];
    REQUIRE(igala.first == "igala");
    REQUIRE(igala.second.size() == 2);

    const auto& xRow = igala.second[0];
    REQUIRE(xRow.model == "x");
    REQUIRE(xRow.overall.count == 8);
    REQUIRE(xRow.overall.mean == Approx(4.0));
    REQUIRE(xRow.overall.ci.lower == Approx(4.0));
    REQUIRE(xRow.overall.ci.upper == Approx(4.0));
    REQUIRE(xRow.dimensions.at("creative_depth").mean == Approx(4.0));

    SECTION("Every roster model gets a row, empty where unscored")
    {
        const auto& lebanese = results.rubricByLanguage[1].second;
        REQUIRE(lebanese.size() == 2);
        REQUIRE(lebanese[0].model == "x");
        REQUIRE_FALSE(lebanese[0].overall.isDefined());
        REQUIRE(lebanese[1].overall.mean == Approx(5.0));
    }

    SECTION("Leaders per language")
    {
        REQUIRE(results.rubricLeaders.size() == 2);
        REQUIRE(results.rubricLeaders[0].language == "igala");
        REQUIRE(results.rubricLeaders[0].model == "x");
        REQUIRE(results.rubricLeaders[0].mean == Approx(4.0));
        REQUIRE(results.rubricLeaders[1].model == "y");
    }

    SECTION("Perfect agreement on every dimension")
    {
        REQUIRE(results.rubricAgreement.size() == 4);
        for (const auto& entry : results.rubricAgreement)
        {
            REQUIRE(entry.level == agreement::MeasurementLevel::Ordinal);
            REQUIRE(entry.result.alpha);
            REQUIRE(*entry.result.alpha == Approx(1.0));
        }
        REQUIRE(results.rubricAgreement[0].label == "Cultural Accuracy");
        REQUIRE(results.overallRubricAlpha);
        REQUIRE(*results.overallRubricAlpha == Approx(1.0));
    }

    SECTION("Category breakdown only fills modalities with records")
    {
        REQUIRE(results.categoryBreakdowns.size() == 2);
        REQUIRE(results.categoryBreakdowns[0].category == "real_world_use");
        REQUIRE_FALSE(results.categoryBreakdowns[0].pairwise);
        REQUIRE(results.categoryBreakdowns[0].rubric);
    }
}

TEST_CASE("BenchmarkAggregator filters invalid scores and models", "[BenchmarkAggregator]")
{
    std::ostringstream log;
    BenchmarkAggregator aggregator(BenchmarkConfiguration::createDefault(), log);

    SECTION("Out-of-scale and fractional scores are ignored")
    {
        std::vector<annotation::RubricRecord> rubric{
            makeRubric("ig_001", "x", "ann1", {{"cultural_accuracy", 6.0}, {"creative_depth", 3.0}}),
            makeRubric("ig_002", "x", "ann1", {{"cultural_accuracy", 2.5}, {"creative_depth", 5.0}})};

        const auto table = aggregator.summarizeRubric(rubric, {"x"});
        REQUIRE(table.size() == 1);
        REQUIRE_FALSE(table[0].dimensions.at("cultural_accuracy").isDefined());
        REQUIRE(table[0].dimensions.at("creative_depth").mean == Approx(4.0));
        REQUIRE(table[0].overall.count == 2);
    }

    SECTION("Unnamed models stay out of the roster and the tallies")
    {
        auto pairwise = lopsidedPairwise();
        pairwise.push_back(makePairwise("ig_005", "x", "", "ann1", WinnerLabel::A));
        pairwise.push_back(makePairwise("ig_006", "x", "y", "ann1", WinnerLabel::Malformed));

        const auto results = aggregator.aggregate(pairwise, {});
        REQUIRE(results.models == std::vector<std::string>{"x", "y"});
        REQUIRE(results.overallPairwise->tallies.at("x").appearances == 4);
        REQUIRE(results.overallPairwise->excludedInvalid + results.overallPairwise->excludedUnknownModel == 2);
    }
}

TEST_CASE("BenchmarkAggregator with no records", "[BenchmarkAggregator]")
{
    std::ostringstream log;
    BenchmarkAggregator aggregator(BenchmarkConfiguration::createDefault(), log);

    const auto results = aggregator.aggregate({}, {});

    REQUIRE(results.empty());
    REQUIRE(results.models.empty());
    REQUIRE_FALSE(results.pairwiseLeader);
    REQUIRE(results.rubricLeaders.empty());
    REQUIRE(results.rubricAgreement.size() == 4);
    for (const auto& entry : results.rubricAgreement)
        REQUIRE_FALSE(entry.result.isDefined());
    REQUIRE_FALSE(results.pairwiseAgreement.result.isDefined());
    REQUIRE_FALSE(results.overallRubricAlpha);
}

TEST_CASE("BenchmarkAggregator pairwise agreement", "[BenchmarkAggregator]")
{
    std::ostringstream log;
    BenchmarkAggregator aggregator(BenchmarkConfiguration::createDefault(), log);

    std::vector<annotation::PairwiseRecord> pairwise{
        makePairwise("ig_001", "x", "y", "ann1", WinnerLabel::A),
        makePairwise("ig_001", "x", "y", "ann2", WinnerLabel::A),
        makePairwise("ig_002", "x", "y", "ann1", WinnerLabel::B),
        makePairwise("ig_002", "x", "y", "ann2", WinnerLabel::B),
        // Later duplicate of ann1's first judgment is discarded
        makePairwise("ig_001", "x", "y", "ann1", WinnerLabel::B)};

    const auto entry = aggregator.computePairwiseAgreement(pairwise);
    REQUIRE(entry.level == agreement::MeasurementLevel::Nominal);
    REQUIRE(entry.result.alpha);
    REQUIRE(*entry.result.alpha == Approx(1.0));
    REQUIRE(entry.discardedDuplicates == 1);
}

TEST_CASE("BenchmarkAggregator meanAlpha", "[BenchmarkAggregator]")
{
    std::vector<AgreementEntry> entries(3);
    entries[0].result.alpha = 0.8;
    entries[2].result.alpha = 0.4;

    REQUIRE(*BenchmarkAggregator::meanAlpha(entries) == Approx(0.6));
    REQUIRE_FALSE(BenchmarkAggregator::meanAlpha({}));
    REQUIRE_FALSE(BenchmarkAggregator::meanAlpha(std::vector<AgreementEntry>(2)));
}

TEST_CASE("BenchmarkAggregator results do not depend on the executor", "[BenchmarkAggregator]")
{
    std::ostringstream log;
    const auto config = BenchmarkConfiguration::createDefault();

    BenchmarkAggregator serial(config, log);
    BenchmarkAggregator pooled(config, log, std::make_shared<concurrency::ThreadPoolExecutor<2>>());

    const auto a = serial.aggregate(lopsidedPairwise(), agreeingRubric());
    const auto b = pooled.aggregate(lopsidedPairwise(), agreeingRubric());

    REQUIRE(a.winRateIntervals.size() == b.winRateIntervals.size());
    for (std::size_t i = 0; i < a.winRateIntervals.size(); ++i)
    {
        REQUIRE(a.winRateIntervals[i].ci.lower == b.winRateIntervals[i].ci.lower);
        REQUIRE(a.winRateIntervals[i].ci.upper == b.winRateIntervals[i].ci.upper);
    }
    for (std::size_t i = 0; i < a.rubricAgreement.size(); ++i)
        REQUIRE(a.rubricAgreement[i].result.alpha == b.rubricAgreement[i].result.alpha);
}
