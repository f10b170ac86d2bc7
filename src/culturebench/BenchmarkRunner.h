#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "BenchmarkConfiguration.h"
#include "IParallelExecutor.h"
#include "PromptMetadata.h"

namespace culturebench {

/**
 * @brief Input locations for one report run
 *
 * Prompt catalogue files are looked up in the "prompts" directory that sits
 * beside the annotations directory.
 */
struct BenchmarkPaths {
    std::string annotationsDir;
    std::string resultsDir;

    std::string pairwiseDir() const;
    std::string rubricDir() const;
    std::string promptsDir() const;
};

/**
 * @brief Reads annotations and prompt metadata, aggregates and renders the report
 */
class BenchmarkRunner {
public:
    BenchmarkRunner(const BenchmarkConfiguration& config,
                    std::ostream& log,
                    std::shared_ptr<concurrency::IParallelExecutor> executor);

    /**
     * @brief Prompt catalogue, or the latest model results file when the catalogue is empty
     */
    annotation::PromptMetadataLookup loadPromptMetadata(const BenchmarkPaths& paths) const;

    /**
     * @brief Full Markdown report
     *
     * @return std::nullopt when neither pairwise nor rubric annotation entries exist
     * @throws AnnotationReaderException / PromptCatalogException on unreadable input
     */
    std::optional<std::string> generateReport(const BenchmarkPaths& paths,
                                              const std::string& epochLabel,
                                              const std::string& generatedDate) const;

private:
    BenchmarkConfiguration config_;
    std::ostream& log_;
    std::shared_ptr<concurrency::IParallelExecutor> executor_;
};

} // namespace culturebench
