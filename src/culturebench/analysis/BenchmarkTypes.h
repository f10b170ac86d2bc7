#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "BootstrapCI.h"
#include "KrippendorffAlpha.h"
#include "WinRateCalculator.h"

namespace culturebench
{
namespace analysis
{

/**
 * @brief Mean of the valid scores in one table cell with its bootstrap interval
 *
 * count == 0 means the cell had no valid scores and is reported as "--".
 */
struct ScoreSummary
{
    std::size_t count = 0;
    double mean = 0.0;
    ConfidenceInterval ci{0.0, 0.0};

    bool isDefined() const { return count > 0; }
};

/**
 * @brief One row of a rubric table: per-dimension cells plus the pooled "overall" cell
 */
struct ModelRubricScores
{
    std::string model;
    std::map<std::string, ScoreSummary> dimensions;
    ScoreSummary overall;
};

/// One row per model, in roster order
using RubricTable = std::vector<ModelRubricScores>;

/**
 * @brief Overall win percentage of a model with a proportion interval
 *
 * ci is expressed as a fraction in [0, 1].
 */
struct WinRateInterval
{
    std::string model;
    std::size_t wins = 0;
    std::size_t appearances = 0;
    double winPercentage = 0.0;
    ConfidenceInterval ci{0.0, 0.0};
};

/**
 * @brief Krippendorff's alpha for one statistic plus what was filtered out
 */
struct AgreementEntry
{
    std::string name;   ///< dimension name, or "pairwise"
    std::string label;  ///< display label
    agreement::MeasurementLevel level = agreement::MeasurementLevel::Nominal;
    agreement::AlphaResult result;
    std::size_t skippedRecords = 0;
    std::size_t discardedDuplicates = 0;
};

struct LanguageLeader
{
    std::string language;
    std::string model;
    double mean = 0.0;
};

struct PairwiseLeader
{
    std::string model;
    double winPercentage = 0.0;
};

struct CategoryBreakdown
{
    std::string category;
    std::optional<WinRateSummary> pairwise;
    std::optional<RubricTable> rubric;
};

/**
 * @brief Everything the report renders, computed from one annotation corpus
 *
 * Slices (per language, per category) appear only when they contain records.
 */
struct BenchmarkResults
{
    std::vector<std::string> models;
    std::vector<std::string> languages;
    std::vector<std::string> categories;

    std::size_t numPairwiseRecords = 0;
    std::size_t numRubricRecords = 0;

    std::vector<LanguageLeader> rubricLeaders;
    std::optional<PairwiseLeader> pairwiseLeader;

    std::optional<WinRateSummary> overallPairwise;
    std::vector<std::pair<std::string, WinRateSummary>> pairwiseByLanguage;
    std::vector<WinRateInterval> winRateIntervals;

    std::vector<std::pair<std::string, RubricTable>> rubricByLanguage;
    std::vector<CategoryBreakdown> categoryBreakdowns;

    std::vector<AgreementEntry> rubricAgreement;
    AgreementEntry pairwiseAgreement;
    std::optional<double> overallRubricAlpha;

    bool hasPairwise() const { return numPairwiseRecords > 0; }
    bool hasRubric() const { return numRubricRecords > 0; }
    bool empty() const { return !hasPairwise() && !hasRubric(); }
};

} // namespace analysis
} // namespace culturebench
