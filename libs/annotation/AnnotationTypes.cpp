#include "AnnotationTypes.h"

#include <cmath>

namespace culturebench
{
  namespace annotation
  {
    WinnerLabel parseWinnerLabel(const std::string& label)
    {
      if (label == "a")
	return WinnerLabel::A;
      if (label == "b")
	return WinnerLabel::B;
      if (label == "tie")
	return WinnerLabel::Tie;
      return WinnerLabel::Malformed;
    }

    std::optional<int> winnerCode(WinnerLabel label)
    {
      switch (label) {
      case WinnerLabel::A:
	return 1;
      case WinnerLabel::B:
	return 2;
      case WinnerLabel::Tie:
	return 3;
      case WinnerLabel::Malformed:
	break;
      }
      return std::nullopt;
    }

    bool ScoreScale::isValid(double value) const
    {
      if (!std::isfinite(value) || std::floor(value) != value)
	return false;
      return value >= static_cast<double>(minimum) && value <= static_cast<double>(maximum);
    }

    bool PairwiseRecord::isValid() const
    {
      return winner != WinnerLabel::Malformed && modelA != modelB;
    }

    analysis::MatchOutcome PairwiseRecord::toMatchOutcome() const
    {
      analysis::MatchResult result = analysis::MatchResult::Invalid;
      switch (winner) {
      case WinnerLabel::A:
	result = analysis::MatchResult::FirstWins;
	break;
      case WinnerLabel::B:
	result = analysis::MatchResult::SecondWins;
	break;
      case WinnerLabel::Tie:
	result = analysis::MatchResult::Tie;
	break;
      case WinnerLabel::Malformed:
	break;
      }
      return analysis::MatchOutcome{modelA, modelB, result};
    }

    std::optional<double> RubricRecord::validScore(const std::string& dimension,
						   const ScoreScale& scale) const
    {
      auto it = scores.find(dimension);
      if (it == scores.end() || !scale.isValid(it->second))
	return std::nullopt;
      return it->second;
    }
  } // namespace annotation
} // namespace culturebench
