#pragma once

#include <optional>
#include <string>

namespace culturebench
{
  namespace agreement
  {
    /**
     * @brief Reporting bands for Krippendorff's alpha.
     *
     * Good >= 0.80, Tentative >= 0.67, Moderate >= 0.40, otherwise Low.
     * An undefined alpha is NotAvailable.
     */
    enum class ReliabilityBand
    {
      Good,
      Tentative,
      Moderate,
      Low,
      NotAvailable
    };

    ReliabilityBand classifyAlpha(const std::optional<double>& alpha);

    std::string toString(ReliabilityBand band);

    inline std::string interpretAlpha(const std::optional<double>& alpha)
    {
      return toString(classifyAlpha(alpha));
    }
  } // namespace agreement
} // namespace culturebench
