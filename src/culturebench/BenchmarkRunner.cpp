#include "BenchmarkRunner.h"

#include <boost/filesystem.hpp>

#include "AnnotationReader.h"
#include "PromptCatalogReader.h"
#include "RecordNormalizer.h"
#include "analysis/BenchmarkAggregator.h"
#include "reporting/MarkdownReporter.h"

namespace fs = boost::filesystem;

namespace culturebench {

std::string BenchmarkPaths::pairwiseDir() const
{
    return (fs::path(annotationsDir) / "pairwise").string();
}

std::string BenchmarkPaths::rubricDir() const
{
    return (fs::path(annotationsDir) / "rubric").string();
}

std::string BenchmarkPaths::promptsDir() const
{
    fs::path dir(annotationsDir);
    dir.remove_trailing_separator();
    return (dir.parent_path() / "prompts").string();
}

BenchmarkRunner::BenchmarkRunner(const BenchmarkConfiguration& config,
                                 std::ostream& log,
                                 std::shared_ptr<concurrency::IParallelExecutor> executor)
    : config_(config),
      log_(log),
      executor_(std::move(executor))
{
}

annotation::PromptMetadataLookup BenchmarkRunner::loadPromptMetadata(const BenchmarkPaths& paths) const
{
    annotation::PromptMetadataLookup lookup(config_.getLanguagePrefixes());
    annotation::PromptCatalogReader reader(log_);

    reader.readCatalogDirectory(paths.promptsDir(), lookup);
    if (lookup.empty())
    {
        log_ << "No prompt catalogue found in " << paths.promptsDir()
             << ", using results metadata" << std::endl;
        reader.readResultsMetadata(paths.resultsDir, lookup);
    }

    log_ << "Prompt metadata entries: " << lookup.size() << std::endl;
    return lookup;
}

std::optional<std::string> BenchmarkRunner::generateReport(const BenchmarkPaths& paths,
                                                           const std::string& epochLabel,
                                                           const std::string& generatedDate) const
{
    annotation::AnnotationReader reader(log_);
    const auto rawPairwise = reader.readPairwiseDirectory(paths.pairwiseDir());
    const auto rawRubric = reader.readRubricDirectory(paths.rubricDir());

    if (rawPairwise.empty() && rawRubric.empty())
        return std::nullopt;

    annotation::RecordNormalizer normalizer(loadPromptMetadata(paths));
    const auto pairwise = normalizer.normalizePairwise(rawPairwise);
    const auto rubric = normalizer.normalizeRubric(rawRubric);

    analysis::BenchmarkAggregator aggregator(config_, log_, executor_);
    const auto results = aggregator.aggregate(pairwise, rubric);

    reporting::MarkdownReporter reporter(config_);
    return reporter.render(results, epochLabel, generatedDate);
}

} // namespace culturebench
