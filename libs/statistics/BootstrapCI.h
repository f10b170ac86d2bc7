#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "IParallelExecutor.h"

namespace culturebench
{
  namespace analysis
  {
    constexpr uint64_t     kDefaultBootstrapSeed = 42;
    constexpr unsigned int kDefaultNumResamples  = 2000;
    constexpr double       kDefaultConfidenceLevel = 0.95;

    struct BootstrapSettings
    {
      unsigned int numResamples    = kDefaultNumResamples;
      double       confidenceLevel = kDefaultConfidenceLevel;
      uint64_t     seed            = kDefaultBootstrapSeed;
    };

    struct ConfidenceInterval
    {
      double lower;
      double upper;

      double halfWidth() const
      {
	return (upper - lower) / 2.0;
      }
    };

    /**
     * @brief Percentile-bootstrap intervals for means and proportions.
     *
     * Every call with the same settings and the same input returns the same
     * interval: replicate b is always drawn from an engine keyed by
     * (seed, b). An optional executor spreads replicates over threads without
     * changing the result.
     *
     * Inputs with fewer than two observations return (estimate, estimate)
     * without resampling; empty inputs return (0, 0).
     */
    class BootstrapCIEngine
    {
    public:
      explicit BootstrapCIEngine(const BootstrapSettings& settings = BootstrapSettings());

      BootstrapCIEngine(const BootstrapSettings& settings,
			std::shared_ptr<concurrency::IParallelExecutor> executor);

      ConfidenceInterval meanInterval(const std::vector<double>& values) const;

      /**
       * @brief Interval for successes/total, resampling the 1/0 outcome vector.
       * @throws std::invalid_argument if successes > total.
       */
      ConfidenceInterval proportionInterval(std::size_t successes, std::size_t total) const;

      const BootstrapSettings& getSettings() const
      {
	return mSettings;
      }

    private:
      BootstrapSettings                               mSettings;
      std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
    };

    ConfidenceInterval ciMean(const std::vector<double>& values,
			      unsigned int numResamples = kDefaultNumResamples,
			      double level = kDefaultConfidenceLevel);

    ConfidenceInterval ciProportion(std::size_t successes,
				    std::size_t total,
				    unsigned int numResamples = kDefaultNumResamples,
				    double level = kDefaultConfidenceLevel);
  } // namespace analysis
} // namespace culturebench
