#include "RecordNormalizer.h"

#include <utility>

namespace culturebench
{
  namespace annotation
  {
    RecordNormalizer::RecordNormalizer(PromptMetadataLookup metadata)
      : mMetadata(std::move(metadata))
    {
    }

    std::vector<PairwiseRecord>
    RecordNormalizer::normalizePairwise(const std::vector<RawPairwiseEntry>& entries) const
    {
      std::vector<PairwiseRecord> records;
      records.reserve(entries.size());

      for (const auto& entry : entries) {
	PairwiseRecord record;
	record.promptId = entry.promptId;
	record.modelA = entry.modelA;
	record.modelB = entry.modelB;
	record.annotatorId = entry.annotatorId;
	record.winner = parseWinnerLabel(entry.winner);
	record.rawWinner = entry.winner;
	record.timestamp = entry.timestamp;
	record.explanation = entry.explanation;
	record.language = mMetadata.resolveLanguage(entry.promptId);
	record.category = mMetadata.resolveCategory(entry.promptId);
	records.push_back(std::move(record));
      }

      return records;
    }

    std::vector<RubricRecord>
    RecordNormalizer::normalizeRubric(const std::vector<RawRubricEntry>& entries) const
    {
      std::vector<RubricRecord> records;
      records.reserve(entries.size());

      for (const auto& entry : entries) {
	RubricRecord record;
	record.promptId = entry.promptId;
	record.model = entry.model;
	record.annotatorId = entry.annotatorId;
	record.timestamp = entry.timestamp;
	record.scores = entry.scores;
	record.language = mMetadata.resolveLanguage(entry.promptId);
	record.category = mMetadata.resolveCategory(entry.promptId);
	records.push_back(std::move(record));
      }

      return records;
    }
  } // namespace annotation
} // namespace culturebench
