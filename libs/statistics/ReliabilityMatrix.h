#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace culturebench
{
  namespace agreement
  {
    /**
     * @brief Identifies one rated item, e.g. {prompt_id, model} for a rubric
     * dimension or {prompt_id, model_a, model_b} for a pairwise judgment.
     */
    using UnitKey = std::vector<std::string>;

    std::string formatUnitKey(const UnitKey& key);

    /**
     * @brief Annotator x unit grid of ratings for one agreement statistic.
     *
     * Rows and columns keep the order in which annotators and units were first
     * seen. A cell is std::nullopt when the annotator did not rate the unit.
     */
    class ReliabilityMatrix
    {
    public:
      using Cell = std::optional<double>;

      /**
       * @throws std::invalid_argument if the cell grid does not match the
       * annotator and unit counts.
       */
      ReliabilityMatrix(std::vector<std::string> annotators,
			std::vector<UnitKey> units,
			std::vector<std::vector<Cell>> cells);

      std::size_t numAnnotators() const
      {
	return mAnnotators.size();
      }

      std::size_t numUnits() const
      {
	return mUnits.size();
      }

      const std::vector<std::string>& getAnnotators() const
      {
	return mAnnotators;
      }

      const std::vector<UnitKey>& getUnits() const
      {
	return mUnits;
      }

      /**
       * @throws std::out_of_range for an invalid annotator or unit index.
       */
      const Cell& at(std::size_t annotator, std::size_t unit) const;

      // Non-missing values for one unit, in annotator order.
      std::vector<double> unitValues(std::size_t unit) const;

      // Total number of non-missing cells.
      std::size_t numRatings() const;

      // Largest number of annotators that rated any single unit.
      std::size_t maxRatingsPerUnit() const;

    private:
      std::vector<std::string>       mAnnotators;
      std::vector<UnitKey>           mUnits;
      std::vector<std::vector<Cell>> mCells;
    };

    /**
     * @brief Accumulates (annotator, unit, value) triples into a ReliabilityMatrix.
     *
     * Duplicate rule: the first rating an annotator gives a unit is kept.
     * Every later rating for the same (annotator, unit) pair is discarded and
     * counted in discardedDuplicates(). Callers that must not lose ratings
     * should deduplicate upstream.
     */
    class ReliabilityMatrixBuilder
    {
    public:
      ReliabilityMatrixBuilder() = default;

      /**
       * @return true if the rating was stored, false if it was a duplicate.
       */
      bool addRating(const std::string& annotatorId, const UnitKey& unit, double value);

      std::size_t numAnnotators() const
      {
	return mAnnotators.size();
      }

      std::size_t numUnits() const
      {
	return mUnits.size();
      }

      std::size_t numRatings() const
      {
	return mRatings.size();
      }

      std::size_t discardedDuplicates() const
      {
	return mDiscarded;
      }

      /**
       * @return the matrix, or std::nullopt (insufficient data) when fewer
       * than two distinct annotators contributed.
       */
      std::optional<ReliabilityMatrix> build() const;

    private:
      std::size_t indexOfAnnotator(const std::string& annotatorId);
      std::size_t indexOfUnit(const UnitKey& unit);

    private:
      std::vector<std::string>                         mAnnotators;
      std::unordered_map<std::string, std::size_t>     mAnnotatorIndex;
      std::vector<UnitKey>                             mUnits;
      std::map<UnitKey, std::size_t>                   mUnitIndex;
      std::map<std::pair<std::size_t, std::size_t>, double> mRatings;
      std::size_t                                      mDiscarded = 0;
    };
  } // namespace agreement
} // namespace culturebench
