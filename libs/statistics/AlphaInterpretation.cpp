#include "AlphaInterpretation.h"

#include <stdexcept>

namespace culturebench
{
  namespace agreement
  {
    ReliabilityBand classifyAlpha(const std::optional<double>& alpha)
    {
      if (!alpha)
	return ReliabilityBand::NotAvailable;
      if (*alpha >= 0.80)
	return ReliabilityBand::Good;
      if (*alpha >= 0.67)
	return ReliabilityBand::Tentative;
      if (*alpha >= 0.40)
	return ReliabilityBand::Moderate;
      return ReliabilityBand::Low;
    }

    std::string toString(ReliabilityBand band)
    {
      switch (band) {
      case ReliabilityBand::Good:
	return "Good";
      case ReliabilityBand::Tentative:
	return "Tentative";
      case ReliabilityBand::Moderate:
	return "Moderate";
      case ReliabilityBand::Low:
	return "Low";
      case ReliabilityBand::NotAvailable:
	return "N/A";
      }
      throw std::invalid_argument("toString: unknown ReliabilityBand");
    }
  } // namespace agreement
} // namespace culturebench
