#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

#include "RngUtils.h"

namespace culturebench
{
  namespace resampling
  {
    /**
     * @brief Ordinary i.i.d. bootstrap: m draws with replacement from x.
     *
     * Annotation scores and win/loss outcomes have no serial structure, so no
     * block length is involved.
     */
    class IIDResampler
    {
    public:
      template <typename Rng>
      void operator()(const std::vector<double>& x,
		      std::vector<double>&       y,
		      std::size_t                m,
		      Rng&                       rng) const
      {
	if (x.empty())
	  throw std::invalid_argument("IIDResampler: empty input");

	y.resize(m);
	for (std::size_t i = 0; i < m; ++i)
	  y[i] = x[rng_utils::get_random_index(rng, x.size())];
      }
    };
  } // namespace resampling
} // namespace culturebench
