#pragma once

#include <map>
#include <optional>
#include <string>

#include "WinRateCalculator.h"

namespace culturebench
{
  namespace annotation
  {
    /**
     * @brief Pairwise judgment as delivered by the annotation tool.
     *
     * Fields missing from the source are empty strings.
     */
    struct RawPairwiseEntry
    {
      std::string                promptId;
      std::string                modelA;
      std::string                modelB;
      std::string                annotatorId;
      std::string                winner;
      std::optional<std::string> timestamp;
      std::optional<std::string> explanation;
    };

    /**
     * @brief Rubric scoring as delivered by the annotation tool.
     *
     * scores holds every numeric dimension value present in the source, in
     * whatever range it was given; dimensions that were not scored are absent.
     */
    struct RawRubricEntry
    {
      std::string                   promptId;
      std::string                   model;
      std::string                   annotatorId;
      std::optional<std::string>    timestamp;
      std::map<std::string, double> scores;
    };

    enum class WinnerLabel
    {
      A,
      B,
      Tie,
      Malformed
    };

    // Exact match on "a", "b" and "tie"; anything else is Malformed.
    WinnerLabel parseWinnerLabel(const std::string& label);

    // Nominal category code used for agreement: a -> 1, b -> 2, tie -> 3.
    std::optional<int> winnerCode(WinnerLabel label);

    /**
     * @brief Integer rating scale for rubric dimensions.
     */
    struct ScoreScale
    {
      int minimum = 1;
      int maximum = 5;

      // True for integral values inside [minimum, maximum].
      bool isValid(double value) const;
    };

    struct PairwiseRecord
    {
      std::string                promptId;
      std::string                modelA;
      std::string                modelB;
      std::string                annotatorId;
      WinnerLabel                winner = WinnerLabel::Malformed;
      std::string                rawWinner;
      std::optional<std::string> timestamp;
      std::optional<std::string> explanation;
      std::string                language;
      std::string                category;

      // Well-formed winner and two distinct models.
      bool isValid() const;

      analysis::MatchOutcome toMatchOutcome() const;
    };

    struct RubricRecord
    {
      std::string                   promptId;
      std::string                   model;
      std::string                   annotatorId;
      std::optional<std::string>    timestamp;
      std::map<std::string, double> scores;
      std::string                   language;
      std::string                   category;

      // The score for a dimension if present and valid on the scale.
      std::optional<double> validScore(const std::string& dimension,
				       const ScoreScale& scale = ScoreScale()) const;
    };
  } // namespace annotation
} // namespace culturebench
