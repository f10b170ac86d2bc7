#pragma once

#include <vector>

#include "AnnotationTypes.h"
#include "PromptMetadata.h"

namespace culturebench
{
  namespace annotation
  {
    /**
     * @brief Turns raw annotation entries into canonical records.
     *
     * Every input entry yields exactly one record, in input order. Malformed
     * winners and out-of-range or missing scores are kept as-is; each
     * statistic filters what it cannot use.
     */
    class RecordNormalizer
    {
    public:
      explicit RecordNormalizer(PromptMetadataLookup metadata);

      std::vector<PairwiseRecord> normalizePairwise(const std::vector<RawPairwiseEntry>& entries) const;
      std::vector<RubricRecord>   normalizeRubric(const std::vector<RawRubricEntry>& entries) const;

      const PromptMetadataLookup& getMetadata() const
      {
	return mMetadata;
      }

    private:
      PromptMetadataLookup mMetadata;
    };
  } // namespace annotation
} // namespace culturebench
