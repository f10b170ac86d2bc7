#include "KrippendorffAlpha.h"

#include <map>
#include <stdexcept>

namespace culturebench
{
  namespace agreement
  {
    std::string toString(MeasurementLevel level)
    {
      switch (level) {
      case MeasurementLevel::Nominal:
	return "nominal";
      case MeasurementLevel::Ordinal:
	return "ordinal";
      case MeasurementLevel::Interval:
	return "interval";
      }
      throw std::invalid_argument("toString: unknown MeasurementLevel");
    }

    KrippendorffAlpha::KrippendorffAlpha(MeasurementLevel level, MarginalPolicy policy)
      : mLevel(level),
	mPolicy(policy)
    {
    }

    AlphaResult KrippendorffAlpha::compute(const std::optional<ReliabilityMatrix>& matrix) const
    {
      if (!matrix)
	return AlphaResult();

      return compute(*matrix);
    }

    AlphaResult KrippendorffAlpha::compute(const ReliabilityMatrix& matrix) const
    {
      AlphaResult result;

      if (matrix.numAnnotators() < 2)
	return result;

      // Value domain in ascending order; ordinal distances depend on it.
      std::map<double, std::size_t> domainIndex;
      for (std::size_t u = 0; u < matrix.numUnits(); ++u)
	for (double v : matrix.unitValues(u))
	  domainIndex.emplace(v, 0);

      std::vector<double> domain;
      domain.reserve(domainIndex.size());
      for (auto& entry : domainIndex) {
	entry.second = domain.size();
	domain.push_back(entry.first);
      }

      const std::size_t V = domain.size();
      std::vector<std::vector<double>> coincidences(V, std::vector<double>(V, 0.0));
      std::vector<double> allValueCounts(V, 0.0);

      for (std::size_t u = 0; u < matrix.numUnits(); ++u) {
	const std::vector<double> values = matrix.unitValues(u);

	std::vector<double> counts(V, 0.0);
	for (double v : values)
	  counts[domainIndex.at(v)] += 1.0;

	for (std::size_t c = 0; c < V; ++c)
	  allValueCounts[c] += counts[c];

	const std::size_t m = values.size();
	if (m < 2)
	  continue;

	++result.pairableUnits;
	result.pairableValues += m;

	const double weight = 1.0 / static_cast<double>(m - 1);
	for (std::size_t c = 0; c < V; ++c) {
	  if (counts[c] == 0.0)
	    continue;
	  for (std::size_t k = 0; k < V; ++k) {
	    const double pairs = counts[c] * (c == k ? counts[k] - 1.0 : counts[k]);
	    coincidences[c][k] += pairs * weight;
	  }
	}
      }

      if (result.pairableUnits == 0)
	return result;

      std::vector<double> marginals(V, 0.0);
      if (mPolicy == MarginalPolicy::PairableOnly) {
	for (std::size_t c = 0; c < V; ++c)
	  for (std::size_t k = 0; k < V; ++k)
	    marginals[c] += coincidences[c][k];
      }
      else {
	marginals = allValueCounts;
      }

      double n = 0.0;
      for (double nc : marginals)
	n += nc;

      const auto delta = distanceMatrix(domain, marginals);

      double observed = 0.0;
      double expected = 0.0;
      for (std::size_t c = 0; c < V; ++c) {
	for (std::size_t k = 0; k < V; ++k) {
	  if (c == k)
	    continue;
	  observed += coincidences[c][k] * delta[c][k];
	  expected += marginals[c] * marginals[k] * delta[c][k];
	}
      }

      result.observedDisagreement = observed / static_cast<double>(result.pairableValues);
      result.expectedDisagreement = expected / (n * (n - 1.0));

      if (result.observedDisagreement == 0.0 && result.expectedDisagreement == 0.0) {
	result.alpha = 1.0;
	return result;
      }

      if (result.expectedDisagreement == 0.0)
	return result;

      result.alpha = 1.0 - result.observedDisagreement / result.expectedDisagreement;
      return result;
    }

    std::vector<std::vector<double>>
    KrippendorffAlpha::distanceMatrix(const std::vector<double>& domain,
				      const std::vector<double>& marginals) const
    {
      const std::size_t V = domain.size();
      std::vector<std::vector<double>> delta(V, std::vector<double>(V, 0.0));

      for (std::size_t c = 0; c < V; ++c) {
	for (std::size_t k = c + 1; k < V; ++k) {
	  double d = 0.0;
	  switch (mLevel) {
	  case MeasurementLevel::Nominal:
	    d = 1.0;
	    break;
	  case MeasurementLevel::Ordinal: {
	    double between = 0.0;
	    for (std::size_t g = c; g <= k; ++g)
	      between += marginals[g];
	    const double gap = between - (marginals[c] + marginals[k]) / 2.0;
	    d = gap * gap;
	    break;
	  }
	  case MeasurementLevel::Interval: {
	    const double diff = domain[c] - domain[k];
	    d = diff * diff;
	    break;
	  }
	  }
	  delta[c][k] = d;
	  delta[k][c] = d;
	}
      }
      return delta;
    }

    std::optional<double> krippendorffAlpha(const ReliabilityMatrix& matrix, MeasurementLevel level)
    {
      return KrippendorffAlpha(level).compute(matrix).alpha;
    }

    std::optional<double> krippendorffAlpha(const std::optional<ReliabilityMatrix>& matrix,
					    MeasurementLevel level)
    {
      return KrippendorffAlpha(level).compute(matrix).alpha;
    }
  } // namespace agreement
} // namespace culturebench
