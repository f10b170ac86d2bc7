#include "MarkdownReporter.h"
#include "AlphaInterpretation.h"
#include "utils/OutputUtils.h"
#include <sstream>

#include <boost/filesystem.hpp>

namespace culturebench
{
namespace reporting
{

using namespace analysis;
using utils::formatAlpha;
using utils::formatFixed;
using utils::formatPercent;
using utils::formatScore;
using utils::formatWholePercent;
using utils::titleCase;
using utils::toDisplayName;

namespace fs = boost::filesystem;

namespace
{

std::string joinLines(const std::vector<std::string>& lines)
{
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            out += '\n';
        out += lines[i];
    }
    return out;
}

std::string joinDisplayNames(const std::vector<std::string>& names, bool identifiers)
{
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        out += identifiers ? toDisplayName(names[i]) : titleCase(names[i]);
    }
    return out;
}

// Small counts read as words in the methodology text
std::string countText(std::size_t n)
{
    static const char* const kWords[] = {"zero", "one", "two", "three", "four", "five",
                                         "six", "seven", "eight", "nine", "ten"};
    return n <= 10 ? kWords[n] : std::to_string(n);
}

std::string separatorRow(std::size_t columns)
{
    std::string row;
    for (std::size_t i = 0; i < columns; ++i)
        row += "|---";
    return row + "|";
}

} // namespace

MarkdownReporter::MarkdownReporter(const BenchmarkConfiguration& config)
    : mConfig(config)
{
}

std::string MarkdownReporter::renderNoAnnotationsMessage(const std::string& annotationsDir)
{
    std::ostringstream msg;
    msg << "No annotation files found.\n"
        << "Place pairwise comparison JSON arrays in:\n"
        << "  " << (fs::path(annotationsDir) / "pairwise").string() << "\n"
        << "Place rubric score JSON arrays in:\n"
        << "  " << (fs::path(annotationsDir) / "rubric").string() << "\n\n"
        << "See data/annotations/pairwise/sample.json and "
        << "data/annotations/rubric/sample.json for examples.";
    return msg.str();
}

std::string MarkdownReporter::renderWinRateTable(const WinRateMatrix& matrix) const
{
    const auto& models = matrix.getModels();

    std::vector<std::string> rows;
    std::string header = "| |";
    for (const auto& m : models)
        header += " " + titleCase(m) + " |";
    rows.push_back(header);
    rows.push_back(separatorRow(models.size() + 1));

    for (const auto& m1 : models)
    {
        std::string row = "| **" + titleCase(m1) + "** |";
        for (const auto& m2 : models)
            row += " " + (m1 == m2 ? std::string("-") : formatPercent(matrix.rate(m1, m2))) + " |";
        rows.push_back(row);
    }
    return joinLines(rows);
}

std::string MarkdownReporter::renderRubricTable(const RubricTable& table) const
{
    const auto& dims = mConfig.getDimensions();

    std::vector<std::string> rows;
    std::string header = "| Model |";
    for (const auto& dim : dims)
        header += " " + dim.label + " |";
    header += " Overall |";
    rows.push_back(header);
    rows.push_back(separatorRow(dims.size() + 2));

    auto cell = [](const ScoreSummary& s) {
        return s.isDefined() ? formatScore(s.mean, s.ci) : std::string("--");
    };

    for (const auto& modelRow : table)
    {
        std::string row = "| **" + titleCase(modelRow.model) + "** |";
        for (const auto& dim : dims)
        {
            auto it = modelRow.dimensions.find(dim.name);
            row += " " + (it != modelRow.dimensions.end() ? cell(it->second) : std::string("--")) + " |";
        }
        row += " " + cell(modelRow.overall) + " |";
        rows.push_back(row);
    }
    return joinLines(rows);
}

std::string MarkdownReporter::renderAgreementTable(const BenchmarkResults& results) const
{
    std::vector<std::string> rows;
    rows.push_back("| Dimension | Krippendorff's alpha | Interpretation |");
    rows.push_back("|---|---|---|");

    for (const auto& entry : results.rubricAgreement)
    {
        rows.push_back("| " + entry.label + " | " + formatAlpha(entry.result.alpha) + " | "
                       + agreement::interpretAlpha(entry.result.alpha) + " |");
    }

    const auto& pw = results.pairwiseAgreement.result.alpha;
    rows.push_back("| Pairwise Selection | " + formatAlpha(pw) + " | "
                   + agreement::interpretAlpha(pw) + " |");
    return joinLines(rows);
}

void MarkdownReporter::writeHeader(std::vector<std::string>& lines,
                                   const BenchmarkResults& results,
                                   const std::string& epochLabel,
                                   const std::string& generatedDate) const
{
    lines.push_back("# Cultural Language Benchmark Report");
    lines.push_back("");
    lines.push_back("**Epoch:** " + epochLabel + "  ");
    lines.push_back("**Date:** " + generatedDate + "  ");
    lines.push_back("**Languages:** " + joinDisplayNames(results.languages, true) + "  ");
    lines.push_back("**Models:** " + joinDisplayNames(results.models, false));
    lines.push_back("");
}

void MarkdownReporter::writeExecutiveSummary(std::vector<std::string>& lines,
                                             const BenchmarkResults& results) const
{
    lines.push_back("## Executive Summary");
    lines.push_back("");

    for (const auto& leader : results.rubricLeaders)
    {
        lines.push_back("- **" + toDisplayName(leader.language) + "**: " + titleCase(leader.model)
                        + " leads with an overall rubric mean of " + formatFixed(leader.mean, 2)
                        + "/" + std::to_string(mConfig.getScoreScale().maximum) + ".");
    }

    if (results.pairwiseLeader)
    {
        lines.push_back("- **Overall pairwise winner**: " + titleCase(results.pairwiseLeader->model)
                        + " (" + formatWholePercent(results.pairwiseLeader->winPercentage)
                        + " win rate across all matchups).");
    }
    lines.push_back("");
}

void MarkdownReporter::writePairwiseSection(std::vector<std::string>& lines,
                                            const BenchmarkResults& results) const
{
    if (!results.hasPairwise())
        return;

    lines.push_back("## Pairwise Win Rates");
    lines.push_back("");
    for (const auto& slice : results.pairwiseByLanguage)
    {
        lines.push_back("### " + toDisplayName(slice.first));
        lines.push_back("");
        lines.push_back(renderWinRateTable(slice.second.matrix));
        lines.push_back("");
    }

    const int level = static_cast<int>(mConfig.getBootstrapSettings().confidenceLevel * 100.0 + 0.5);
    const std::string levelText = std::to_string(level) + "%";

    lines.push_back("### Win Rate Confidence Intervals (" + levelText + ")");
    lines.push_back("");
    lines.push_back("| Model | Overall Win % | " + levelText + " CI |");
    lines.push_back("|---|---|---|");
    for (const auto& interval : results.winRateIntervals)
    {
        lines.push_back("| **" + titleCase(interval.model) + "** | "
                        + formatWholePercent(interval.winPercentage) + " | ["
                        + formatWholePercent(interval.ci.lower * 100.0) + ", "
                        + formatWholePercent(interval.ci.upper * 100.0) + "] |");
    }
    lines.push_back("");
}

void MarkdownReporter::writeRubricSection(std::vector<std::string>& lines,
                                          const BenchmarkResults& results) const
{
    if (!results.hasRubric())
        return;

    lines.push_back("## Rubric Scores");
    lines.push_back("");
    for (const auto& slice : results.rubricByLanguage)
    {
        lines.push_back("### " + toDisplayName(slice.first));
        lines.push_back("");
        lines.push_back(renderRubricTable(slice.second));
        lines.push_back("");
    }
}

void MarkdownReporter::writeCategorySection(std::vector<std::string>& lines,
                                            const BenchmarkResults& results) const
{
    if (results.categoryBreakdowns.empty())
        return;

    lines.push_back("## Breakdown by Prompt Category");
    lines.push_back("");
    for (const auto& breakdown : results.categoryBreakdowns)
    {
        lines.push_back("### " + mConfig.getCategoryLabel(breakdown.category));
        lines.push_back("");

        if (breakdown.pairwise)
        {
            lines.push_back("**Pairwise Win Rates:**");
            lines.push_back("");
            lines.push_back(renderWinRateTable(breakdown.pairwise->matrix));
            lines.push_back("");
        }
        if (breakdown.rubric)
        {
            lines.push_back("**Rubric Scores:**");
            lines.push_back("");
            lines.push_back(renderRubricTable(*breakdown.rubric));
            lines.push_back("");
        }
    }
}

void MarkdownReporter::writeMethodology(std::vector<std::string>& lines) const
{
    const auto& boot = mConfig.getBootstrapSettings();
    const auto& scale = mConfig.getScoreScale();
    const auto& dims = mConfig.getDimensions();

    std::string dimensionList;
    for (std::size_t i = 0; i < dims.size(); ++i)
    {
        if (i > 0)
            dimensionList += (i + 1 == dims.size()) ? (dims.size() > 2 ? ", and " : " and ") : ", ";
        dimensionList += dims[i].label;
    }

    const int level = static_cast<int>(boot.confidenceLevel * 100.0 + 0.5);

    lines.push_back("## Methodology");
    lines.push_back("");
    lines.push_back("This benchmark evaluates large language models on culturally grounded "
                    "prompts across multiple languages. Evaluation combines two approaches:");
    lines.push_back("");
    lines.push_back("1. **Pairwise comparison**: Human annotators compare outputs from two "
                    "models side-by-side and select the better response, with a written "
                    "explanation. Win rates are computed per model pair.");
    lines.push_back("2. **Rubric scoring**: Each model output is scored on a "
                    + std::to_string(scale.minimum) + "-" + std::to_string(scale.maximum)
                    + " scale across " + countText(dims.size())
                    + (dims.size() == 1 ? " dimension: " : " dimensions: ")
                    + dimensionList + ".");
    lines.push_back("");
    lines.push_back("Inter-annotator agreement is measured using Krippendorff's alpha -- "
                    "ordinal scale for rubric scores and nominal scale for pairwise "
                    "selections. Confidence intervals are computed via bootstrap resampling ("
                    + std::to_string(boot.numResamples) + " iterations, "
                    + std::to_string(level) + "% CI).");
    lines.push_back("");
}

std::string MarkdownReporter::render(const BenchmarkResults& results,
                                     const std::string& epochLabel,
                                     const std::string& generatedDate) const
{
    std::vector<std::string> lines;

    writeHeader(lines, results, epochLabel, generatedDate);
    writeExecutiveSummary(lines, results);
    writePairwiseSection(lines, results);
    writeRubricSection(lines, results);
    writeCategorySection(lines, results);

    lines.push_back("## Inter-Annotator Agreement");
    lines.push_back("");
    lines.push_back(renderAgreementTable(results));
    lines.push_back("");

    if (results.overallRubricAlpha)
    {
        lines.push_back("**Overall rubric alpha (mean across dimensions):** "
                        + formatAlpha(results.overallRubricAlpha) + " ("
                        + agreement::interpretAlpha(results.overallRubricAlpha) + ")");
        lines.push_back("");
    }

    writeMethodology(lines);

    return joinLines(lines);
}

} // namespace reporting
} // namespace culturebench
