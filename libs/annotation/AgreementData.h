#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "AnnotationTypes.h"
#include "ReliabilityMatrix.h"
#include "WinRateCalculator.h"

namespace culturebench
{
  namespace annotation
  {
    /**
     * @brief Reliability matrix for one statistic plus what was dropped building it.
     *
     * matrix is std::nullopt when fewer than two annotators supplied a usable
     * value.
     */
    struct ExtractedMatrix
    {
      std::optional<agreement::ReliabilityMatrix> matrix;
      std::size_t                                 skippedRecords = 0;      ///< missing/invalid value
      std::size_t                                 discardedDuplicates = 0; ///< later ratings of the same unit
    };

    /**
     * @brief Annotator x (prompt_id, model) matrix of one rubric dimension.
     *
     * Records without a valid score for the dimension are skipped.
     */
    ExtractedMatrix extractRubricMatrix(const std::vector<RubricRecord>& records,
					const std::string& dimension,
					const ScoreScale& scale = ScoreScale());

    /**
     * @brief Annotator x (prompt_id, model_a, model_b) matrix of winner codes.
     *
     * Records with a malformed winner or identical models are skipped.
     */
    ExtractedMatrix extractPairwiseMatrix(const std::vector<PairwiseRecord>& records);

    std::vector<analysis::MatchOutcome> toMatchOutcomes(const std::vector<PairwiseRecord>& records);
  } // namespace annotation
} // namespace culturebench
