#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/aggregation/CandidateAggregator.hpp"
#include "core/metadata/SpecimenIndex.hpp"

namespace hbl {

// Full audit chain of one specimen:
// sources -> specimen -> transformations -> attempts -> record -> review.
// The record is recomputed here, never read back from a snapshot.
struct LineageChain {
  Specimen                       specimen;
  std::vector<SourceFile>        sources;
  std::vector<Transformation>    transformations;
  std::vector<ExtractionAttempt> attempts;  // every status, oldest first
  AggregatedRecord               record;
  std::vector<QualityFlag>       flags;
  std::optional<ReviewReference> review;
};

class ProvenanceTracker {
public:
  ProvenanceTracker(SpecimenIndex& index, const CandidateAggregator& aggregator)
    : index_(index), aggregator_(aggregator) {}

  std::optional<LineageChain> lineage(const SpecimenIdentity& identity);
  // One chain per specimen currently holding the catalog number.
  std::vector<LineageChain> lineageByCatalogNumber(const std::string& catalogNumber);

private:
  SpecimenIndex&             index_;
  const CandidateAggregator& aggregator_;
};

// Node/edge form plus the raw entities, for audit export.
nlohmann::json toJson(const LineageChain& chain);

} // namespace hbl
