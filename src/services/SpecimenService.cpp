#include "services/SpecimenService.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <set>
#include <system_error>

#include "core/addressing/ContentAddressor.hpp"
#include "core/errors/Errors.hpp"
#include "core/storage/ImageStore.hpp"

using nlohmann::json;

namespace hbl {

SpecimenService::SpecimenService(SpecimenIndex& index, const AppConfig& cfg, ImageStore* images)
  : index_(index),
    images_(images),
    aggregator_(cfg.aggregation),
    auditor_(cfg.audit),
    dedup_(index),
    tracker_(index, aggregator_) {}

void SpecimenService::requireSpecimen(const SpecimenIdentity& identity) {
  if (!index_.specimen(identity)) throw ConfigurationError("unknown specimen: " + identity);
}

IngestResult SpecimenService::ingest(std::string_view bytes, const std::string& sourceRef) {
  if (bytes.empty()) throw ConfigurationError("image is empty");
  const std::string hash = hashImage(bytes);
  const std::string stored = images_ ? images_->put(hash, bytes) : std::string();
  return registerSource(hash, sourceRef, stored);
}

IngestResult SpecimenService::ingestFile(const std::string& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) throw ConfigurationError("cannot open image: " + path);
  if (size == 0) throw ConfigurationError("image is empty: " + path);
  const std::string hash = hashFile(path);
  const std::string stored = images_ ? images_->putFile(hash, path) : std::string();
  return registerSource(hash, std::filesystem::absolute(path).string(), stored);
}

IngestResult SpecimenService::registerSource(const std::string& imageHash, const std::string& sourceRef,
                                             const std::string& storedAt) {
  IngestResult out;
  out.image_hash = imageHash;
  out.stored_at  = storedAt;
  // A registered derived image (crop, deskew, ...) belongs to its specimen.
  const auto owner = index_.resolveIdentity(imageHash);
  out.identity = owner ? *owner : imageHash;
  out.created  = index_.registerSpecimen(out.identity, sourceRef);
  if (out.created) {
    spdlog::info("new specimen {} from {}", out.identity, sourceRef.empty() ? "(unnamed)" : sourceRef);
  } else if (out.identity != imageHash) {
    spdlog::info("image {} resolved to specimen {} via {}", imageHash, out.identity, sourceRef);
  } else {
    spdlog::debug("specimen {} seen again via {}", out.identity, sourceRef);
  }
  return out;
}

void SpecimenService::registerTransformation(const Transformation& t) {
  requireSpecimen(t.specimen);
  index_.registerTransformation(t);
}

DedupOutcome SpecimenService::extract(const SpecimenIdentity& identity, const json& params,
                                      ExtractionEngine& engine, bool force) {
  requireSpecimen(identity);
  ImageRef image{identity, images_ ? images_->pathFor(identity) : std::string()};
  DedupOutcome out = dedup_.run(image, params, engine, force);
  if (out.kind != DedupKind::Skipped) recompute(identity);
  return out;
}

DedupOutcome SpecimenService::submit(const SpecimenIdentity& identity, const json& params,
                                     const EngineResult& result, bool failed, bool force) {
  requireSpecimen(identity);
  DedupOutcome out = dedup_.submit(identity, params, result, failed, force);
  if (out.kind != DedupKind::Skipped) recompute(identity);
  return out;
}

void SpecimenService::refreshFlags(const SpecimenIdentity& identity, const AggregationResult& result) {
  std::vector<SpecimenIdentity> holders;
  if (auto catalog = result.record.catalogNumber()) holders = index_.queryByCatalogNumber(*catalog);

  std::vector<QualityFlag> flags = result.flags;
  for (auto& f : auditor_.audit(result.record, holders)) flags.push_back(std::move(f));
  index_.replaceFlags(identity, flags);
}

AggregatedRecord SpecimenService::recompute(const SpecimenIdentity& identity) {
  const auto previousCatalog = index_.catalogNumberOf(identity);

  AggregationResult result = aggregator_.aggregate(identity, index_.attempts(identity));
  index_.saveAggregation(result.record);
  refreshFlags(identity, result);

  // Duplicate flags on other specimens depend on this one's catalogNumber.
  std::set<SpecimenIdentity> peers;
  if (previousCatalog) {
    for (auto& id : index_.queryByCatalogNumber(*previousCatalog)) peers.insert(id);
  }
  if (auto catalog = result.record.catalogNumber()) {
    for (auto& id : index_.queryByCatalogNumber(*catalog)) peers.insert(id);
  }
  peers.erase(identity);
  for (const auto& peer : peers) {
    refreshFlags(peer, aggregator_.aggregate(peer, index_.attempts(peer)));
  }
  if (previousCatalog) {
    auto current = result.record.catalogNumber();
    if (!current || normalizeValue(*current) != *previousCatalog) {
      spdlog::debug("specimen {} catalogNumber changed from '{}'", identity, *previousCatalog);
    }
  }

  spdlog::debug("specimen {} recomputed: {} fields, {} conflicts, confidence {:.3f}",
                identity, result.record.fields.size() + result.record.extra.size(),
                result.record.conflicts.size(), result.record.confidence);
  return result.record;
}

size_t SpecimenService::recomputeAll() {
  // Two passes: the first refreshes every catalogNumber snapshot, the
  // second audits against the complete set so duplicate flags converge.
  std::vector<SpecimenIdentity> all;
  SpecimenFilter filter;
  filter.limit = 500;
  for (;;) {
    SpecimenPage page = index_.listSpecimens(filter);
    for (auto& s : page.items) all.push_back(std::move(s.identity));
    if (page.next_cursor.empty()) break;
    filter.after = page.next_cursor;
  }

  std::vector<AggregationResult> results;
  results.reserve(all.size());
  for (const auto& id : all) {
    results.push_back(aggregator_.aggregate(id, index_.attempts(id)));
    index_.saveAggregation(results.back().record);
  }
  for (size_t i = 0; i < all.size(); ++i) refreshFlags(all[i], results[i]);

  spdlog::info("recomputed {} specimens", all.size());
  return all.size();
}

std::optional<std::pair<AggregatedRecord, std::vector<QualityFlag>>>
SpecimenService::getAggregatedRecord(const SpecimenIdentity& identity) {
  if (!index_.specimen(identity)) return std::nullopt;
  AggregatedRecord record = aggregator_.aggregate(identity, index_.attempts(identity)).record;
  return std::make_pair(std::move(record), index_.flags(identity, true));
}

void SpecimenService::attachReview(const ReviewReference& ref) {
  requireSpecimen(ref.specimen);
  index_.attachReview(ref);
  spdlog::info("review {} ({}) attached to {}", ref.decision_ref, ref.status, ref.specimen);
}

} // namespace hbl
