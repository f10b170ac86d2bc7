#include "WinRateCalculator.h"

#include <algorithm>
#include <stdexcept>

namespace culturebench
{
  namespace analysis
  {
    WinRateMatrix::WinRateMatrix(std::vector<std::string> models)
      : mModels(std::move(models)),
	mIndex(),
	mWins(mModels.size(), std::vector<std::size_t>(mModels.size(), 0))
    {
      for (std::size_t i = 0; i < mModels.size(); ++i)
	mIndex.emplace(mModels[i], i);
    }

    bool WinRateMatrix::hasModel(const std::string& model) const
    {
      return mIndex.find(model) != mIndex.end();
    }

    std::size_t WinRateMatrix::indexOf(const std::string& model) const
    {
      auto it = mIndex.find(model);
      if (it == mIndex.end())
	throw std::out_of_range("WinRateMatrix: unknown model " + model);
      return it->second;
    }

    std::size_t WinRateMatrix::wins(const std::string& winner, const std::string& loser) const
    {
      return mWins[indexOf(winner)][indexOf(loser)];
    }

    std::optional<double> WinRateMatrix::rate(const std::string& m1, const std::string& m2) const
    {
      const std::size_t i = indexOf(m1);
      const std::size_t j = indexOf(m2);
      if (i == j)
	return std::nullopt;

      const std::size_t w = mWins[i][j];
      const std::size_t l = mWins[j][i];
      if (w + l == 0)
	return std::nullopt;

      return static_cast<double>(w) / static_cast<double>(w + l);
    }

    bool WinRateMatrix::isEmpty() const
    {
      for (const auto& row : mWins)
	for (std::size_t count : row)
	  if (count > 0)
	    return false;
      return true;
    }

    void WinRateMatrix::recordWin(const std::string& winner, const std::string& loser)
    {
      const std::size_t i = indexOf(winner);
      const std::size_t j = indexOf(loser);
      if (i == j)
	throw std::invalid_argument("WinRateMatrix: a model cannot beat itself");

      ++mWins[i][j];
    }

    WinRateCalculator::WinRateCalculator(std::vector<std::string> roster)
      : mRoster()
    {
      for (auto& model : roster)
	if (std::find(mRoster.begin(), mRoster.end(), model) == mRoster.end())
	  mRoster.push_back(std::move(model));
    }

    WinRateSummary WinRateCalculator::compute(const std::vector<MatchOutcome>& outcomes) const
    {
      WinRateSummary summary{WinRateMatrix(mRoster), {}, 0, 0};
      for (const auto& model : mRoster)
	summary.tallies.emplace(model, ModelTally());

      for (const auto& outcome : outcomes) {
	if (!summary.matrix.hasModel(outcome.first) || !summary.matrix.hasModel(outcome.second)) {
	  ++summary.excludedUnknownModel;
	  continue;
	}
	if (outcome.result == MatchResult::Invalid || outcome.first == outcome.second) {
	  ++summary.excludedInvalid;
	  continue;
	}

	ModelTally& first = summary.tallies.at(outcome.first);
	ModelTally& second = summary.tallies.at(outcome.second);
	++first.appearances;
	++second.appearances;

	switch (outcome.result) {
	case MatchResult::FirstWins:
	  summary.matrix.recordWin(outcome.first, outcome.second);
	  ++first.wins;
	  ++second.losses;
	  break;
	case MatchResult::SecondWins:
	  summary.matrix.recordWin(outcome.second, outcome.first);
	  ++second.wins;
	  ++first.losses;
	  break;
	case MatchResult::Tie:
	  ++first.ties;
	  ++second.ties;
	  break;
	case MatchResult::Invalid:
	  break;
	}
      }

      return summary;
    }
  } // namespace analysis
} // namespace culturebench
