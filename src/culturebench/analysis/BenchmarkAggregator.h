#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "AnnotationTypes.h"
#include "BenchmarkConfiguration.h"
#include "BenchmarkTypes.h"
#include "BootstrapCI.h"
#include "IParallelExecutor.h"

namespace culturebench
{
namespace analysis
{

/**
 * @brief Turns normalized annotation records into every statistic the report shows
 *
 * The model roster is the sorted set of model names seen in either modality.
 * Win-rate matrices and rubric tables are computed per language and per prompt
 * category; agreement is computed once over the whole corpus (ordinal alpha per
 * rubric dimension, nominal alpha over pairwise winners). Agreement statistics
 * are fanned out over the executor; the bootstrap engine shares it for its
 * replicates.
 *
 * Progress is written to the log stream.
 */
class BenchmarkAggregator
{
public:
    BenchmarkAggregator(const BenchmarkConfiguration& config,
                        std::ostream& log,
                        std::shared_ptr<concurrency::IParallelExecutor> executor);

    BenchmarkAggregator(const BenchmarkConfiguration& config, std::ostream& log);

    BenchmarkResults aggregate(const std::vector<annotation::PairwiseRecord>& pairwise,
                               const std::vector<annotation::RubricRecord>& rubric) const;

    /**
     * @brief Directed win counts over the given roster
     */
    WinRateSummary computeWinRates(const std::vector<annotation::PairwiseRecord>& pairwise,
                                   const std::vector<std::string>& models) const;

    /**
     * @brief Overall win percentage per roster model with a bootstrap proportion interval
     */
    std::vector<WinRateInterval> computeWinRateIntervals(const WinRateSummary& summary) const;

    /**
     * @brief Per-model, per-dimension score means with bootstrap intervals
     *
     * Only scores valid on the configured scale are used. The overall cell pools
     * every valid score of the model across all dimensions.
     */
    RubricTable summarizeRubric(const std::vector<annotation::RubricRecord>& rubric,
                                const std::vector<std::string>& models) const;

    /**
     * @brief Ordinal alpha for each configured dimension, in configuration order
     */
    std::vector<AgreementEntry> computeRubricAgreement(const std::vector<annotation::RubricRecord>& rubric) const;

    /**
     * @brief Nominal alpha over winner codes
     */
    AgreementEntry computePairwiseAgreement(const std::vector<annotation::PairwiseRecord>& pairwise) const;

    /**
     * @brief Mean of the defined alphas; std::nullopt when none is defined
     */
    static std::optional<double> meanAlpha(const std::vector<AgreementEntry>& entries);

    ScoreSummary summarizeScores(const std::vector<double>& values) const;

private:
    BenchmarkConfiguration mConfig;
    std::ostream& mLog;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
    BootstrapCIEngine mBootstrap;
};

} // namespace analysis
} // namespace culturebench
