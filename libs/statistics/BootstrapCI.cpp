#include "BootstrapCI.h"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <stdexcept>

#include "IIDResampler.h"
#include "ParallelExecutors.h"
#include "PercentileBootstrap.h"
#include "RngUtils.h"
#include "StatUtils.h"

namespace culturebench
{
  namespace analysis
  {
    namespace
    {
      using MeanSampler = std::function<double(const std::vector<double>&)>;
      using MeanBootstrap = PercentileBootstrap<MeanSampler,
						resampling::IIDResampler,
						std::mt19937_64,
						concurrency::IParallelExecutor>;

      ConfidenceInterval runMeanBootstrap(const std::vector<double>& values,
					  const BootstrapSettings& settings,
					  const std::shared_ptr<concurrency::IParallelExecutor>& executor)
      {
	MeanBootstrap bootstrap(settings.numResamples,
				settings.confidenceLevel,
				resampling::IIDResampler(),
				executor);

	rng_utils::CRNEngineProvider<std::mt19937_64> provider{rng_utils::CRNKey(settings.seed)};
	const auto result = bootstrap.run(values, &StatUtils::computeMean, provider);
	return ConfidenceInterval{result.lower, result.upper};
      }
    }

    BootstrapCIEngine::BootstrapCIEngine(const BootstrapSettings& settings)
      : BootstrapCIEngine(settings, std::make_shared<concurrency::SingleThreadExecutor>())
    {
    }

    BootstrapCIEngine::BootstrapCIEngine(const BootstrapSettings& settings,
					 std::shared_ptr<concurrency::IParallelExecutor> executor)
      : mSettings(settings),
	mExecutor(std::move(executor))
    {
      if (mSettings.numResamples == 0)
	throw std::invalid_argument("BootstrapCIEngine: numResamples must be positive");
      if (!(mSettings.confidenceLevel > 0.0 && mSettings.confidenceLevel < 1.0))
	throw std::invalid_argument("BootstrapCIEngine: confidence level must be in (0,1)");
      if (!mExecutor)
	throw std::invalid_argument("BootstrapCIEngine: executor must not be null");
    }

    ConfidenceInterval BootstrapCIEngine::meanInterval(const std::vector<double>& values) const
    {
      return runMeanBootstrap(values, mSettings, mExecutor);
    }

    ConfidenceInterval BootstrapCIEngine::proportionInterval(std::size_t successes,
							     std::size_t total) const
    {
      if (successes > total)
	throw std::invalid_argument("BootstrapCIEngine: successes exceed total");

      // Successes first, then failures; order is irrelevant to i.i.d. draws
      // but fixing it keeps the draw sequence reproducible.
      std::vector<double> outcomes(total, 0.0);
      std::fill(outcomes.begin(), outcomes.begin() + static_cast<std::ptrdiff_t>(successes), 1.0);

      return runMeanBootstrap(outcomes, mSettings, mExecutor);
    }

    ConfidenceInterval ciMean(const std::vector<double>& values,
			      unsigned int numResamples,
			      double level)
    {
      BootstrapSettings settings;
      settings.numResamples = numResamples;
      settings.confidenceLevel = level;
      return BootstrapCIEngine(settings).meanInterval(values);
    }

    ConfidenceInterval ciProportion(std::size_t successes,
				    std::size_t total,
				    unsigned int numResamples,
				    double level)
    {
      BootstrapSettings settings;
      settings.numResamples = numResamples;
      settings.confidenceLevel = level;
      return BootstrapCIEngine(settings).proportionInterval(successes, total);
    }
  } // namespace analysis
} // namespace culturebench
