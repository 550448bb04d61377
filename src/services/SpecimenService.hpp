#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/aggregation/CandidateAggregator.hpp"
#include "core/config/Config.hpp"
#include "core/dedup/AttemptDeduplicator.hpp"
#include "core/metadata/SpecimenIndex.hpp"
#include "core/provenance/ProvenanceTracker.hpp"
#include "core/quality/QualityAuditor.hpp"
#include "services/ExportCursor.hpp"

namespace hbl {

class ImageStore;

struct IngestResult {
  SpecimenIdentity identity;    // owning specimen
  std::string      image_hash;  // hash of the bytes; differs from identity for a derived image
  bool             created = false;
  std::string      stored_at;   // empty without an ImageStore
};

// Wires the core together: append to the index, then derive. Every write
// path ends in recompute(), which rebuilds the aggregation and flags from
// the full attempt set.
class SpecimenService {
public:
  SpecimenService(SpecimenIndex& index, const AppConfig& cfg, ImageStore* images = nullptr);

  IngestResult ingest(std::string_view bytes, const std::string& sourceRef);
  IngestResult ingestFile(const std::string& path);
  void registerTransformation(const Transformation& t);

  DedupOutcome extract(const SpecimenIdentity& identity, const nlohmann::json& params,
                       ExtractionEngine& engine, bool force = false);
  DedupOutcome submit(const SpecimenIdentity& identity, const nlohmann::json& params,
                      const EngineResult& result, bool failed = false, bool force = false);

  // Rebuilds the specimen's record and flags, then re-audits every other
  // specimen that shares its old or new catalogNumber.
  AggregatedRecord recompute(const SpecimenIdentity& identity);
  // Recomputes every specimen; returns how many were processed.
  size_t recomputeAll();

  // Record computed on read, with the current unresolved flags.
  std::optional<std::pair<AggregatedRecord, std::vector<QualityFlag>>>
  getAggregatedRecord(const SpecimenIdentity& identity);

  SpecimenPage listSpecimens(const SpecimenFilter& filter) { return index_.listSpecimens(filter); }
  void attachReview(const ReviewReference& ref);
  bool resolveFlag(int64_t flagId) { return index_.resolveFlag(flagId); }

  std::optional<LineageChain> lineage(const SpecimenIdentity& identity) { return tracker_.lineage(identity); }
  std::vector<LineageChain> lineageByCatalogNumber(const std::string& value) {
    return tracker_.lineageByCatalogNumber(value);
  }

  ExportCursor exportRecords(SpecimenFilter filter) { return ExportCursor(index_, tracker_, std::move(filter)); }
  IndexStats stats() { return index_.stats(); }

  SpecimenIndex& index() { return index_; }

private:
  void refreshFlags(const SpecimenIdentity& identity, const AggregationResult& result);
  void requireSpecimen(const SpecimenIdentity& identity);
  IngestResult registerSource(const std::string& imageHash, const std::string& sourceRef,
                              const std::string& storedAt);

  SpecimenIndex&      index_;
  ImageStore*         images_;
  CandidateAggregator aggregator_;
  QualityAuditor      auditor_;
  AttemptDeduplicator dedup_;
  ProvenanceTracker   tracker_;
};

} // namespace hbl
