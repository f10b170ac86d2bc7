#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

#include "RngUtils.h"
#include "StatUtils.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"

namespace culturebench
{
  namespace analysis
  {

    /**
     * @brief n-out-of-n percentile bootstrap confidence interval.
     *
     *  - Given a statistic θ = sampler(x) on an input sample x of size n,
     *  - draw B resamples y_b of length n through the injected Resampler,
     *  - compute θ*_b = sampler(y_b),
     *  - report the type-7 empirical quantiles of {θ*_b} at (1 - CL)/2 and
     *    (1 + CL)/2.
     *
     * Samples with fewer than two observations are degenerate: no resampling is
     * performed and both bounds equal θ̂ (0 for an empty sample).
     *
     * Replicate b always draws from provider.make_engine(b), so the interval is
     * bit-identical for a given provider no matter which Executor runs it.
     *
     * @tparam Sampler   Callable `double(const std::vector<double>&)`.
     * @tparam Resampler Provides `operator()(x, y, m, rng)`.
     * @tparam Rng       Engine type returned by the provider.
     * @tparam Executor  Executor used by concurrency::parallel_for_chunked. May
     *                   be the abstract concurrency::IParallelExecutor when an
     *                   executor instance is injected.
     */
    template<
      class Sampler,
      class Resampler,
      class Rng      = std::mt19937_64,
      class Executor = concurrency::SingleThreadExecutor
      >
    class PercentileBootstrap
    {
    public:
      struct Result
      {
	double      estimate;     // θ̂ on the original sample
	double      lower;        // percentile lower bound
	double      upper;        // percentile upper bound
	double      cl;           // confidence level
	std::size_t B;            // requested replicates
	std::size_t effective_B;  // finite replicates used (0 when degenerate)
	std::size_t skipped;      // non-finite replicates dropped
	std::size_t n;            // original sample size
      };

    public:
      /**
       * @param B                Number of replicates (> 0).
       * @param confidence_level Confidence level in (0, 1).
       * @param resampler        Resampler used for each replicate.
       *
       * @throws std::invalid_argument on B == 0 or CL outside (0, 1).
       */
      PercentileBootstrap(std::size_t      B,
			  double           confidence_level,
			  const Resampler& resampler)
	: PercentileBootstrap(B, confidence_level, resampler, std::make_shared<Executor>())
      {}

      PercentileBootstrap(std::size_t               B,
			  double                    confidence_level,
			  const Resampler&          resampler,
			  std::shared_ptr<Executor> executor)
	: m_B(B),
	  m_CL(confidence_level),
	  m_resampler(resampler),
	  m_exec(std::move(executor))
      {
	if (m_B == 0)
	  throw std::invalid_argument("PercentileBootstrap: B must be positive");
	if (!(m_CL > 0.0 && m_CL < 1.0))
	  throw std::invalid_argument("PercentileBootstrap: CL must be in (0,1)");
	if (!m_exec)
	  throw std::invalid_argument("PercentileBootstrap: executor must not be null");
      }

      /**
       * @brief Run the bootstrap with per-replicate engines from @p provider.
       *
       * @tparam Provider Type with `Rng make_engine(std::size_t) const`.
       *
       * @throws std::runtime_error if fewer than half the replicates are finite.
       */
      template<class Provider>
      Result run(const std::vector<double>& x,
		 Sampler                    sampler,
		 const Provider&            provider) const
      {
	const std::size_t n = x.size();

	if (n < 2) {
	  const double point = n == 0 ? 0.0 : sampler(x);
	  return Result{ point, point, point, m_CL, m_B, 0, 0, n };
	}

	const double theta_hat = sampler(x);

	// NaN marks a replicate whose statistic was not finite
	std::vector<double> thetas(m_B, std::numeric_limits<double>::quiet_NaN());

	concurrency::parallel_for_chunked(
	  static_cast<uint32_t>(m_B),
	  *m_exec,
	  [&](uint32_t b) {
	    Rng rng_b = provider.make_engine(b);
	    std::vector<double> y;
	    m_resampler(x, y, n, rng_b);
	    const double v = sampler(y);
	    if (std::isfinite(v))
	      thetas[b] = v;
	  });

	auto it = std::remove_if(thetas.begin(), thetas.end(),
				 [](double v) { return !std::isfinite(v); });
	const std::size_t skipped = static_cast<std::size_t>(std::distance(it, thetas.end()));
	thetas.erase(it, thetas.end());

	if (thetas.empty() || thetas.size() < m_B / 2)
	  throw std::runtime_error("PercentileBootstrap: too many degenerate replicates");

	std::sort(thetas.begin(), thetas.end());

	const double alpha = 1.0 - m_CL;
	const double lb = StatUtils::quantileType7Sorted(thetas, alpha / 2.0);
	const double ub = StatUtils::quantileType7Sorted(thetas, 1.0 - alpha / 2.0);

	return Result{ theta_hat, lb, ub, m_CL, m_B, thetas.size(), skipped, n };
      }

      std::size_t      B()         const { return m_B; }
      double           CL()        const { return m_CL; }
      const Resampler& resampler() const { return m_resampler; }

    private:
      std::size_t               m_B;
      double                    m_CL;
      Resampler                 m_resampler;
      std::shared_ptr<Executor> m_exec;
    };

  } // namespace analysis
} // namespace culturebench
