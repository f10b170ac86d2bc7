#include "AgreementData.h"

namespace culturebench
{
  namespace annotation
  {
    using agreement::ReliabilityMatrixBuilder;
    using agreement::UnitKey;

    ExtractedMatrix extractRubricMatrix(const std::vector<RubricRecord>& records,
					const std::string& dimension,
					const ScoreScale& scale)
    {
      ExtractedMatrix extracted;
      ReliabilityMatrixBuilder builder;

      for (const auto& record : records) {
	const auto score = record.validScore(dimension, scale);
	if (!score) {
	  ++extracted.skippedRecords;
	  continue;
	}
	builder.addRating(record.annotatorId, UnitKey{record.promptId, record.model}, *score);
      }

      extracted.discardedDuplicates = builder.discardedDuplicates();
      extracted.matrix = builder.build();
      return extracted;
    }

    ExtractedMatrix extractPairwiseMatrix(const std::vector<PairwiseRecord>& records)
    {
      ExtractedMatrix extracted;
      ReliabilityMatrixBuilder builder;

      for (const auto& record : records) {
	const auto code = winnerCode(record.winner);
	if (!code || !record.isValid()) {
	  ++extracted.skippedRecords;
	  continue;
	}
	builder.addRating(record.annotatorId,
			  UnitKey{record.promptId, record.modelA, record.modelB},
			  static_cast<double>(*code));
      }

      extracted.discardedDuplicates = builder.discardedDuplicates();
      extracted.matrix = builder.build();
      return extracted;
    }

    std::vector<analysis::MatchOutcome> toMatchOutcomes(const std::vector<PairwiseRecord>& records)
    {
      std::vector<analysis::MatchOutcome> outcomes;
      outcomes.reserve(records.size());
      for (const auto& record : records)
	outcomes.push_back(record.toMatchOutcome());
      return outcomes;
    }
  } // namespace annotation
} // namespace culturebench
