#include "core/provenance/ProvenanceTracker.hpp"

#include "core/model/Json.hpp"

using nlohmann::json;

namespace hbl {

std::optional<LineageChain> ProvenanceTracker::lineage(const SpecimenIdentity& identity) {
  auto specimen = index_.specimen(identity);
  if (!specimen) return std::nullopt;

  LineageChain chain;
  chain.specimen        = *specimen;
  chain.sources         = index_.sources(identity);
  chain.transformations = index_.transformations(identity);
  chain.attempts        = index_.attempts(identity);
  chain.record          = aggregator_.aggregate(identity, chain.attempts).record;
  chain.flags           = index_.flags(identity, false);
  chain.review          = index_.review(identity);
  return chain;
}

std::vector<LineageChain> ProvenanceTracker::lineageByCatalogNumber(const std::string& catalogNumber) {
  std::vector<LineageChain> out;
  for (const auto& id : index_.queryByCatalogNumber(catalogNumber)) {
    if (auto chain = lineage(id)) out.push_back(std::move(*chain));
  }
  return out;
}

json toJson(const LineageChain& chain) {
  const std::string specimenNode = "specimen:" + chain.specimen.identity;
  const std::string recordNode   = "record:" + chain.specimen.identity;

  json edges = json::array();
  for (const auto& s : chain.sources) {
    edges.push_back({{"from", "source:" + s.source_ref}, {"to", specimenNode}, {"kind", "source"}});
  }
  for (const auto& t : chain.transformations) {
    const std::string from = t.derived_from == chain.specimen.identity
                               ? specimenNode : "image:" + t.derived_from;
    edges.push_back({{"from", from}, {"to", "image:" + t.image_hash}, {"kind", t.operation}});
  }
  for (const auto& a : chain.attempts) {
    edges.push_back({{"from", specimenNode}, {"to", "attempt:" + a.id}, {"kind", "extraction"}});
    if (a.status == AttemptStatus::Complete) {
      edges.push_back({{"from", "attempt:" + a.id}, {"to", recordNode}, {"kind", "aggregation"}});
    }
  }
  if (chain.review) {
    edges.push_back({{"from", recordNode}, {"to", "review:" + chain.review->decision_ref},
                     {"kind", "review"}});
  }

  json sources = json::array();
  for (const auto& s : chain.sources) sources.push_back(toJson(s));
  json transformations = json::array();
  for (const auto& t : chain.transformations) transformations.push_back(toJson(t));
  json attempts = json::array();
  for (const auto& a : chain.attempts) attempts.push_back(toJson(a));
  json flags = json::array();
  for (const auto& f : chain.flags) flags.push_back(toJson(f));

  return json{
    {"specimen", {{"identity", chain.specimen.identity},
                  {"first_seen_at", chain.specimen.first_seen_at}}},
    {"sources", std::move(sources)},
    {"transformations", std::move(transformations)},
    {"attempts", std::move(attempts)},
    {"record", toJson(chain.record)},
    {"flags", std::move(flags)},
    {"review", chain.review ? toJson(*chain.review) : json(nullptr)},
    {"edges", std::move(edges)}
  };
}

} // namespace hbl
