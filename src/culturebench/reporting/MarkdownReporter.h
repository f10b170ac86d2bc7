#pragma once

#include <string>
#include <vector>

#include "BenchmarkConfiguration.h"
#include "analysis/BenchmarkTypes.h"

namespace culturebench
{
namespace reporting
{

/**
 * @brief Renders aggregated benchmark statistics as a Markdown report
 *
 * Sections: header, executive summary, pairwise win rates per language with
 * a win-rate interval table, rubric scores per language, breakdown by prompt
 * category, inter-annotator agreement and methodology. Sections without data
 * are omitted, except agreement and methodology which are always present.
 */
class MarkdownReporter
{
public:
    explicit MarkdownReporter(const BenchmarkConfiguration& config);

    /**
     * @param results       Aggregated statistics
     * @param epochLabel    Label shown in the header ("all" when no epoch was given)
     * @param generatedDate Timestamp shown in the header
     */
    std::string render(const analysis::BenchmarkResults& results,
                       const std::string& epochLabel,
                       const std::string& generatedDate) const;

    /**
     * @brief Row model beats column model; "-" on the diagonal, "--" when unobserved
     */
    std::string renderWinRateTable(const analysis::WinRateMatrix& matrix) const;

    std::string renderRubricTable(const analysis::RubricTable& table) const;

    std::string renderAgreementTable(const analysis::BenchmarkResults& results) const;

    /**
     * @brief Guidance printed instead of a report when no annotation files exist
     */
    static std::string renderNoAnnotationsMessage(const std::string& annotationsDir);

private:
    void writeHeader(std::vector<std::string>& lines,
                     const analysis::BenchmarkResults& results,
                     const std::string& epochLabel,
                     const std::string& generatedDate) const;
    void writeExecutiveSummary(std::vector<std::string>& lines,
                               const analysis::BenchmarkResults& results) const;
    void writePairwiseSection(std::vector<std::string>& lines,
                              const analysis::BenchmarkResults& results) const;
    void writeRubricSection(std::vector<std::string>& lines,
                            const analysis::BenchmarkResults& results) const;
    void writeCategorySection(std::vector<std::string>& lines,
                              const analysis::BenchmarkResults& results) const;
    void writeMethodology(std::vector<std::string>& lines) const;

    BenchmarkConfiguration mConfig;
};

} // namespace reporting
} // namespace culturebench
