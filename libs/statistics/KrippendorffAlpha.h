#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ReliabilityMatrix.h"

namespace culturebench
{
  namespace agreement
  {
    enum class MeasurementLevel
    {
      Nominal,   ///< categories are unordered labels (pairwise winner)
      Ordinal,   ///< ordered categories, distance from marginal ranks (rubric scores)
      Interval   ///< squared numeric difference
    };

    /**
     * @brief Which ratings feed the marginal value distribution n_c.
     *
     * AllValues gives a different alpha only when some unit is rated once.
     */
    enum class MarginalPolicy
    {
      PairableOnly, ///< only values in units rated at least twice (Krippendorff's definition)
      AllValues     ///< every rated value, including units rated once
    };

    std::string toString(MeasurementLevel level);

    /**
     * @brief Outcome of one alpha computation.
     *
     * alpha is std::nullopt when the statistic has no support: fewer than two
     * annotators, no unit rated by two or more annotators, or zero expected
     * disagreement with nonzero observed disagreement.
     */
    struct AlphaResult
    {
      std::optional<double> alpha;
      double                observedDisagreement = 0.0;
      double                expectedDisagreement = 0.0;
      std::size_t           pairableUnits = 0;
      std::size_t           pairableValues = 0;

      bool isDefined() const
      {
	return alpha.has_value();
      }
    };

    /**
     * @brief Krippendorff's alpha reliability coefficient.
     *
     * Computed from the coincidence matrix:
     *
     *   o_ck = Σ_u (# ordered pairs (c,k) from different annotators in u) / (m_u - 1)
     *   e_ck = n_c (n_k - [c == k]) / (n - 1)
     *   alpha = 1 - (Σ o_ck δ_ck / Σ o) / (Σ e_ck δ_ck / n)
     *
     * where m_u is the number of ratings in unit u and n_c the marginal count of
     * value c. Units with m_u < 2 contribute no pairs.
     *
     * Ordinal distances use the marginal frequencies of the categories, not
     * their numeric gap:
     *
     *   δ(c,k) = (Σ_{g=c..k} n_g - (n_c + n_k) / 2)^2     for c <= k in value order
     *
     * When observed and expected disagreement are both zero (every rating has
     * the same value) alpha is 1 by convention.
     */
    class KrippendorffAlpha
    {
    public:
      explicit KrippendorffAlpha(MeasurementLevel level,
				 MarginalPolicy policy = MarginalPolicy::PairableOnly);

      AlphaResult compute(const ReliabilityMatrix& matrix) const;

      // std::nullopt in means insufficient data out.
      AlphaResult compute(const std::optional<ReliabilityMatrix>& matrix) const;

      MeasurementLevel getLevel() const
      {
	return mLevel;
      }

      MarginalPolicy getPolicy() const
      {
	return mPolicy;
      }

    private:
      std::vector<std::vector<double>> distanceMatrix(const std::vector<double>& domain,
						      const std::vector<double>& marginals) const;

    private:
      MeasurementLevel mLevel;
      MarginalPolicy   mPolicy;
    };

    std::optional<double> krippendorffAlpha(const ReliabilityMatrix& matrix, MeasurementLevel level);
    std::optional<double> krippendorffAlpha(const std::optional<ReliabilityMatrix>& matrix,
					    MeasurementLevel level);
  } // namespace agreement
} // namespace culturebench
