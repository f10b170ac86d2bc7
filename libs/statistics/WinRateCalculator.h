#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace culturebench
{
  namespace analysis
  {
    enum class MatchResult
    {
      FirstWins,
      SecondWins,
      Tie,
      Invalid   ///< unrecognised winner label
    };

    /**
     * @brief One directional comparison between two models.
     */
    struct MatchOutcome
    {
      std::string first;
      std::string second;
      MatchResult result;
    };

    struct ModelTally
    {
      std::size_t wins = 0;
      std::size_t losses = 0;
      std::size_t ties = 0;
      std::size_t appearances = 0;

      // wins / appearances in percent, 0 for a model that never appeared
      double winPercentage() const
      {
	return appearances > 0
	  ? 100.0 * static_cast<double>(wins) / static_cast<double>(appearances)
	  : 0.0;
      }
    };

    /**
     * @brief Directed win counts over a fixed model roster.
     *
     * wins(m1, m2) counts outcomes where m1 beat m2. Each rate cell is
     * recomputed from the two directed counts, so rate(m1, m2) is undefined
     * whenever the pair never produced a decisive outcome and no symmetry is
     * forced on sparse data.
     */
    class WinRateMatrix
    {
    public:
      explicit WinRateMatrix(std::vector<std::string> models);

      const std::vector<std::string>& getModels() const
      {
	return mModels;
      }

      bool hasModel(const std::string& model) const;

      /**
       * @throws std::out_of_range if either model is not in the roster.
       */
      std::size_t wins(const std::string& winner, const std::string& loser) const;

      /**
       * @brief wins(m1,m2) / (wins(m1,m2) + wins(m2,m1)).
       *
       * std::nullopt for self pairs and for pairs without decisive outcomes.
       * @throws std::out_of_range if either model is not in the roster.
       */
      std::optional<double> rate(const std::string& m1, const std::string& m2) const;

      // True when no decisive outcome was recorded for any pair.
      bool isEmpty() const;

      void recordWin(const std::string& winner, const std::string& loser);

    private:
      std::size_t indexOf(const std::string& model) const;

    private:
      std::vector<std::string>                     mModels;
      std::unordered_map<std::string, std::size_t> mIndex;
      std::vector<std::vector<std::size_t>>        mWins;
    };

    struct WinRateSummary
    {
      WinRateMatrix                     matrix;
      std::map<std::string, ModelTally> tallies;
      std::size_t                       excludedUnknownModel = 0;
      std::size_t                       excludedInvalid = 0;

      /**
       * @throws std::out_of_range if the model is not in the roster.
       */
      double overallWinPercentage(const std::string& model) const
      {
	return tallies.at(model).winPercentage();
      }
    };

    /**
     * @brief Tallies pairwise outcomes against a declared model roster.
     *
     * Outcomes are excluded (and counted) when they name a model outside the
     * roster, compare a model with itself, or carry an invalid result. Ties
     * count as an appearance for both sides but never as a win.
     */
    class WinRateCalculator
    {
    public:
      explicit WinRateCalculator(std::vector<std::string> roster);

      WinRateSummary compute(const std::vector<MatchOutcome>& outcomes) const;

      const std::vector<std::string>& getRoster() const
      {
	return mRoster;
      }

    private:
      std::vector<std::string> mRoster;
    };
  } // namespace analysis
} // namespace culturebench
