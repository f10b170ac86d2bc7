#include "ReliabilityMatrix.h"

#include <algorithm>
#include <stdexcept>

namespace culturebench
{
  namespace agreement
  {
    std::string formatUnitKey(const UnitKey& key)
    {
      std::string out;
      for (std::size_t i = 0; i < key.size(); ++i) {
	if (i > 0)
	  out += '|';
	out += key[i];
      }
      return out;
    }

    ReliabilityMatrix::ReliabilityMatrix(std::vector<std::string> annotators,
					 std::vector<UnitKey> units,
					 std::vector<std::vector<Cell>> cells)
      : mAnnotators(std::move(annotators)),
	mUnits(std::move(units)),
	mCells(std::move(cells))
    {
      if (mCells.size() != mAnnotators.size())
	throw std::invalid_argument("ReliabilityMatrix: row count does not match annotator count");

      for (const auto& row : mCells)
	if (row.size() != mUnits.size())
	  throw std::invalid_argument("ReliabilityMatrix: column count does not match unit count");
    }

    const ReliabilityMatrix::Cell& ReliabilityMatrix::at(std::size_t annotator, std::size_t unit) const
    {
      if (annotator >= mAnnotators.size() || unit >= mUnits.size())
	throw std::out_of_range("ReliabilityMatrix::at: index out of range");

      return mCells[annotator][unit];
    }

    std::vector<double> ReliabilityMatrix::unitValues(std::size_t unit) const
    {
      if (unit >= mUnits.size())
	throw std::out_of_range("ReliabilityMatrix::unitValues: unit out of range");

      std::vector<double> values;
      for (const auto& row : mCells)
	if (row[unit])
	  values.push_back(*row[unit]);

      return values;
    }

    std::size_t ReliabilityMatrix::numRatings() const
    {
      std::size_t count = 0;
      for (const auto& row : mCells)
	count += static_cast<std::size_t>(std::count_if(row.begin(), row.end(),
						       [](const Cell& c) { return c.has_value(); }));
      return count;
    }

    std::size_t ReliabilityMatrix::maxRatingsPerUnit() const
    {
      std::size_t best = 0;
      for (std::size_t u = 0; u < mUnits.size(); ++u)
	best = std::max(best, unitValues(u).size());
      return best;
    }

    bool ReliabilityMatrixBuilder::addRating(const std::string& annotatorId,
					     const UnitKey& unit,
					     double value)
    {
      const std::size_t row = indexOfAnnotator(annotatorId);
      const std::size_t col = indexOfUnit(unit);

      const bool inserted = mRatings.emplace(std::make_pair(row, col), value).second;
      if (!inserted)
	++mDiscarded;

      return inserted;
    }

    std::optional<ReliabilityMatrix> ReliabilityMatrixBuilder::build() const
    {
      if (mAnnotators.size() < 2)
	return std::nullopt;

      std::vector<std::vector<ReliabilityMatrix::Cell>> cells(
	mAnnotators.size(), std::vector<ReliabilityMatrix::Cell>(mUnits.size()));

      for (const auto& entry : mRatings)
	cells[entry.first.first][entry.first.second] = entry.second;

      return ReliabilityMatrix(mAnnotators, mUnits, std::move(cells));
    }

    std::size_t ReliabilityMatrixBuilder::indexOfAnnotator(const std::string& annotatorId)
    {
      auto it = mAnnotatorIndex.find(annotatorId);
      if (it != mAnnotatorIndex.end())
	return it->second;

      mAnnotators.push_back(annotatorId);
      mAnnotatorIndex.emplace(annotatorId, mAnnotators.size() - 1);
      return mAnnotators.size() - 1;
    }

    std::size_t ReliabilityMatrixBuilder::indexOfUnit(const UnitKey& unit)
    {
      auto it = mUnitIndex.find(unit);
      if (it != mUnitIndex.end())
	return it->second;

      mUnits.push_back(unit);
      mUnitIndex.emplace(unit, mUnits.size() - 1);
      return mUnits.size() - 1;
    }
  } // namespace agreement
} // namespace culturebench
