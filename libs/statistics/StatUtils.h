#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace culturebench
{
  struct StatUtils
  {
    /**
     * @brief Arithmetic mean; 0 for an empty series.
     */
    static double computeMean(const std::vector<double>& x)
    {
      if (x.empty())
	return 0.0;

      const double sum = std::accumulate(x.begin(), x.end(), 0.0);
      return sum / static_cast<double>(x.size());
    }

    /**
     * @brief Hyndman-Fan type-7 quantile of an ascending-sorted series.
     *
     * h = (n - 1) * p; the result interpolates linearly between the order
     * statistics floor(h) and floor(h) + 1. This is the "linear" method used
     * by most statistics packages for percentile bootstrap bounds.
     *
     * @throws std::invalid_argument if the series is empty.
     */
    static double quantileType7Sorted(const std::vector<double>& sorted, double p)
    {
      if (sorted.empty())
	throw std::invalid_argument("StatUtils::quantileType7Sorted: empty input");
      if (p <= 0.0)
	return sorted.front();
      if (p >= 1.0)
	return sorted.back();

      const double h = (static_cast<double>(sorted.size()) - 1.0) * p;
      const std::size_t lo = static_cast<std::size_t>(std::floor(h));
      const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
      const double frac = h - static_cast<double>(lo);

      return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
    }

    // Unsorted convenience overload; copies and sorts.
    static double quantileType7(std::vector<double> x, double p)
    {
      std::sort(x.begin(), x.end());
      return quantileType7Sorted(x, p);
    }
  };
} // namespace culturebench
