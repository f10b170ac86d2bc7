#include "BenchmarkAggregator.h"
#include "AgreementData.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include <algorithm>
#include <functional>
#include <set>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>

namespace ba = boost::accumulators;

namespace culturebench
{
namespace analysis
{

namespace
{

using ScoreAccumulator = ba::accumulator_set<double, ba::stats<ba::tag::count, ba::tag::mean>>;

template<typename Record>
std::vector<Record> filterRecords(const std::vector<Record>& records,
                                  const std::function<bool(const Record&)>& keep)
{
    std::vector<Record> out;
    for (const auto& r : records)
    {
        if (keep(r))
            out.push_back(r);
    }
    return out;
}

void insertIfNamed(std::set<std::string>& names, const std::string& name)
{
    if (!name.empty())
        names.insert(name);
}

} // namespace

BenchmarkAggregator::BenchmarkAggregator(const BenchmarkConfiguration& config,
                                         std::ostream& log,
                                         std::shared_ptr<concurrency::IParallelExecutor> executor)
    : mConfig(config),
      mLog(log),
      mExecutor(std::move(executor)),
      mBootstrap(config.getBootstrapSettings(), mExecutor)
{
}

BenchmarkAggregator::BenchmarkAggregator(const BenchmarkConfiguration& config, std::ostream& log)
    : BenchmarkAggregator(config, log, std::make_shared<concurrency::SingleThreadExecutor>())
{
}

ScoreSummary BenchmarkAggregator::summarizeScores(const std::vector<double>& values) const
{
    ScoreSummary summary;
    if (values.empty())
        return summary;

    ScoreAccumulator acc;
    for (double v : values)
        acc(v);

    summary.count = ba::count(acc);
    summary.mean = ba::mean(acc);
    summary.ci = mBootstrap.meanInterval(values);
    return summary;
}

WinRateSummary BenchmarkAggregator::computeWinRates(const std::vector<annotation::PairwiseRecord>& pairwise,
                                                    const std::vector<std::string>& models) const
{
    return WinRateCalculator(models).compute(annotation::toMatchOutcomes(pairwise));
}

std::vector<WinRateInterval> BenchmarkAggregator::computeWinRateIntervals(const WinRateSummary& summary) const
{
    std::vector<WinRateInterval> intervals;
    for (const auto& model : summary.matrix.getModels())
    {
        const ModelTally& tally = summary.tallies.at(model);

        WinRateInterval interval;
        interval.model = model;
        interval.wins = tally.wins;
        interval.appearances = tally.appearances;
        interval.winPercentage = tally.winPercentage();
        interval.ci = mBootstrap.proportionInterval(tally.wins, tally.appearances);
        intervals.push_back(interval);
    }
    return intervals;
}

RubricTable BenchmarkAggregator::summarizeRubric(const std::vector<annotation::RubricRecord>& rubric,
                                                 const std::vector<std::string>& models) const
{
    const auto dimensions = mConfig.getDimensionNames();
    const auto& scale = mConfig.getScoreScale();

    // model -> dimension -> valid scores, in record order
    std::map<std::string, std::map<std::string, std::vector<double>>> scores;
    for (const auto& record : rubric)
    {
        for (const auto& dim : dimensions)
        {
            const auto score = record.validScore(dim, scale);
            if (score)
                scores[record.model][dim].push_back(*score);
        }
    }

    RubricTable table;
    table.reserve(models.size());
    for (const auto& model : models)
    {
        ModelRubricScores row;
        row.model = model;

        std::vector<double> pooled;
        for (const auto& dim : dimensions)
        {
            std::vector<double> values;
            auto m = scores.find(model);
            if (m != scores.end())
            {
                auto d = m->second.find(dim);
                if (d != m->second.end())
                    values = d->second;
            }
            row.dimensions[dim] = summarizeScores(values);
            pooled.insert(pooled.end(), values.begin(), values.end());
        }
        row.overall = summarizeScores(pooled);
        table.push_back(std::move(row));
    }
    return table;
}

std::vector<AgreementEntry>
BenchmarkAggregator::computeRubricAgreement(const std::vector<annotation::RubricRecord>& rubric) const
{
    const auto& dims = mConfig.getDimensions();
    std::vector<AgreementEntry> entries(dims.size());

    agreement::KrippendorffAlpha alpha(agreement::MeasurementLevel::Ordinal, mConfig.getMarginalPolicy());

    concurrency::parallel_for(static_cast<uint32_t>(dims.size()), *mExecutor,
        [&](uint32_t i) {
            const auto extracted = annotation::extractRubricMatrix(rubric, dims[i].name,
                                                                   mConfig.getScoreScale());
            AgreementEntry& entry = entries[i];
            entry.name = dims[i].name;
            entry.label = dims[i].label;
            entry.level = agreement::MeasurementLevel::Ordinal;
            entry.result = alpha.compute(extracted.matrix);
            entry.skippedRecords = extracted.skippedRecords;
            entry.discardedDuplicates = extracted.discardedDuplicates;
        });

    return entries;
}

AgreementEntry
BenchmarkAggregator::computePairwiseAgreement(const std::vector<annotation::PairwiseRecord>& pairwise) const
{
    const auto extracted = annotation::extractPairwiseMatrix(pairwise);

    AgreementEntry entry;
    entry.name = "pairwise";
    entry.label = "Pairwise Selection";
    entry.level = agreement::MeasurementLevel::Nominal;
    entry.result = agreement::KrippendorffAlpha(agreement::MeasurementLevel::Nominal,
                                                mConfig.getMarginalPolicy()).compute(extracted.matrix);
    entry.skippedRecords = extracted.skippedRecords;
    entry.discardedDuplicates = extracted.discardedDuplicates;
    return entry;
}

std::optional<double> BenchmarkAggregator::meanAlpha(const std::vector<AgreementEntry>& entries)
{
    double sum = 0.0;
    std::size_t n = 0;
    for (const auto& entry : entries)
    {
        if (entry.result.alpha)
        {
            sum += *entry.result.alpha;
            ++n;
        }
    }
    if (n == 0)
        return std::nullopt;
    return sum / static_cast<double>(n);
}

BenchmarkResults BenchmarkAggregator::aggregate(const std::vector<annotation::PairwiseRecord>& pairwise,
                                                const std::vector<annotation::RubricRecord>& rubric) const
{
    using annotation::PairwiseRecord;
    using annotation::RubricRecord;

    BenchmarkResults results;
    results.numPairwiseRecords = pairwise.size();
    results.numRubricRecords = rubric.size();

    std::set<std::string> models, languages, categories;
    for (const auto& r : pairwise)
    {
        insertIfNamed(models, r.modelA);
        insertIfNamed(models, r.modelB);
        languages.insert(r.language);
        categories.insert(r.category);
    }
    for (const auto& r : rubric)
    {
        insertIfNamed(models, r.model);
        languages.insert(r.language);
        categories.insert(r.category);
    }
    results.models.assign(models.begin(), models.end());
    results.languages.assign(languages.begin(), languages.end());
    results.categories.assign(categories.begin(), categories.end());

    mLog << "Aggregating " << pairwise.size() << " pairwise and " << rubric.size()
         << " rubric records across " << results.models.size() << " models and "
         << results.languages.size() << " languages" << std::endl;

    // Pairwise win rates
    if (results.hasPairwise())
    {
        const auto overall = computeWinRates(pairwise, results.models);
        if (overall.excludedInvalid > 0 || overall.excludedUnknownModel > 0)
        {
            mLog << "Excluded from win rates: " << overall.excludedInvalid
                 << " malformed or self-paired, " << overall.excludedUnknownModel
                 << " with an unknown model" << std::endl;
        }

        for (const auto& language : results.languages)
        {
            const auto slice = filterRecords<PairwiseRecord>(pairwise,
                [&language](const PairwiseRecord& r) { return r.language == language; });
            if (!slice.empty())
                results.pairwiseByLanguage.emplace_back(language, computeWinRates(slice, results.models));
        }

        results.winRateIntervals = computeWinRateIntervals(overall);

        // First model in roster order wins ties
        for (const auto& model : results.models)
        {
            const double pct = overall.overallWinPercentage(model);
            if (!results.pairwiseLeader || pct > results.pairwiseLeader->winPercentage)
                results.pairwiseLeader = PairwiseLeader{model, pct};
        }
        results.overallPairwise = overall;
    }

    // Rubric tables and per-language leaders
    if (results.hasRubric())
    {
        for (const auto& language : results.languages)
        {
            const auto slice = filterRecords<RubricRecord>(rubric,
                [&language](const RubricRecord& r) { return r.language == language; });
            if (slice.empty())
                continue;

            RubricTable table = summarizeRubric(slice, results.models);

            std::optional<LanguageLeader> best;
            for (const auto& row : table)
            {
                if (row.overall.isDefined() && (!best || row.overall.mean > best->mean))
                    best = LanguageLeader{language, row.model, row.overall.mean};
            }
            if (best)
                results.rubricLeaders.push_back(*best);

            results.rubricByLanguage.emplace_back(language, std::move(table));
        }
    }

    // Category breakdown
    for (const auto& category : results.categories)
    {
        CategoryBreakdown breakdown;
        breakdown.category = category;

        const auto pairSlice = filterRecords<PairwiseRecord>(pairwise,
            [&category](const PairwiseRecord& r) { return r.category == category; });
        if (!pairSlice.empty())
            breakdown.pairwise = computeWinRates(pairSlice, results.models);

        const auto rubricSlice = filterRecords<RubricRecord>(rubric,
            [&category](const RubricRecord& r) { return r.category == category; });
        if (!rubricSlice.empty())
            breakdown.rubric = summarizeRubric(rubricSlice, results.models);

        results.categoryBreakdowns.push_back(std::move(breakdown));
    }

    // Inter-annotator agreement
    mLog << "Computing Krippendorff's alpha for " << mConfig.getDimensions().size()
         << " rubric dimensions and pairwise selection" << std::endl;

    results.rubricAgreement = computeRubricAgreement(rubric);
    results.pairwiseAgreement = computePairwiseAgreement(pairwise);
    if (results.hasRubric())
        results.overallRubricAlpha = meanAlpha(results.rubricAgreement);

    for (const auto& entry : results.rubricAgreement)
    {
        if (entry.discardedDuplicates > 0)
            mLog << "Warning: " << entry.discardedDuplicates << " duplicate ratings ignored for "
                 << entry.name << " (first rating kept)" << std::endl;
    }
    if (results.pairwiseAgreement.discardedDuplicates > 0)
        mLog << "Warning: " << results.pairwiseAgreement.discardedDuplicates
             << " duplicate pairwise judgments ignored (first judgment kept)" << std::endl;

    return results;
}

} // namespace analysis
} // namespace culturebench
