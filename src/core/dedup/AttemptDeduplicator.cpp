#include "core/dedup/AttemptDeduplicator.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

#include "core/addressing/ContentAddressor.hpp"
#include "core/errors/Errors.hpp"

using nlohmann::json;

namespace hbl {

namespace {

// Empty when the provider response is usable.
std::string malformation(const EngineResult& r) {
  auto bad = [](const FieldValue& v) {
    return !std::isfinite(v.confidence) || v.confidence < 0.0 || v.confidence > 1.0;
  };
  for (const auto& [f, v] : r.fields.known) {
    if (bad(v)) return std::string("confidence outside [0,1] for ") + fieldName(f);
  }
  for (const auto& [name, v] : r.fields.extra) {
    if (bad(v)) return "confidence outside [0,1] for " + name;
  }
  return std::string();
}

std::string stringParam(const json& params, const char* key, const std::string& def) {
  auto it = params.find(key);
  if (it != params.end() && it->is_string()) return it->get<std::string>();
  return def;
}

} // namespace

const char* toString(DedupKind k) {
  switch (k) {
    case DedupKind::Skipped:   return "skipped";
    case DedupKind::Recorded:  return "recorded";
    case DedupKind::Failed:    return "failed";
    case DedupKind::Duplicate: return "duplicate";
  }
  return "skipped";
}

AttemptKey AttemptDeduplicator::keyFor(const SpecimenIdentity& identity, const json& params,
                                       const std::string& fallbackProvider, bool force) const {
  AttemptKey key;
  key.specimen    = identity;
  key.params_json = canonicalParams(params);
  key.params_hash = sha256Hex(key.params_json);
  key.provider    = stringParam(params, "provider", fallbackProvider);
  key.model       = stringParam(params, "model", "");
  key.forced      = force;
  return key;
}

DedupOutcome AttemptDeduplicator::run(const ImageRef& image, const json& params,
                                      ExtractionEngine& engine, bool force) {
  const AttemptKey key = keyFor(image.identity, params, engine.name(), force);

  DedupOutcome out;
  out.params_hash = key.params_hash;

  ExtractDecision decision = index_.shouldExtract(key.specimen, key.params_hash, force);
  if (!decision.extract) {
    out.kind = DedupKind::Skipped;
    out.canonical_attempt = decision.existing_attempt;
    spdlog::debug("skip {} / {}: canonical attempt {}", key.specimen, key.params_hash,
                  decision.existing_attempt.value_or("?"));
    return out;
  }

  out.attempt_id = index_.beginAttempt(key);

  EngineResult result;
  try {
    result = engine.extract(image, params);
  } catch (const TransientEngineError& e) {
    out.errors = {std::string("transient: ") + e.what()};
  } catch (const ConfigurationError& e) {
    out.errors = {std::string("configuration: ") + e.what()};
  } catch (const std::exception& e) {
    out.errors = {std::string("engine error: ") + e.what()};
  }
  if (!out.errors.empty()) {
    index_.failAttempt(out.attempt_id, out.errors, FieldSet{});
    out.kind = DedupKind::Failed;
    spdlog::warn("attempt {} on {} failed: {}", out.attempt_id, key.specimen, out.errors.front());
    return out;
  }
  return complete(std::move(out), key, result);
}

DedupOutcome AttemptDeduplicator::complete(DedupOutcome out, const AttemptKey& key,
                                           const EngineResult& result) {
  const std::string malformed = malformation(result);
  if (!malformed.empty() || !result.errors.empty() || result.fields.empty()) {
    out.errors = result.errors;
    if (!malformed.empty()) out.errors.push_back("malformed provider response: " + malformed);
    if (out.errors.empty()) out.errors.push_back("provider returned no fields");
    // A malformed payload is not kept; a partial one with errors is.
    index_.failAttempt(out.attempt_id, out.errors, malformed.empty() ? result.fields : FieldSet{});
    out.kind = DedupKind::Failed;
    spdlog::warn("attempt {} on {} failed: {}", out.attempt_id, key.specimen, out.errors.front());
    return out;
  }

  try {
    index_.completeAttempt(out.attempt_id, result.fields);
    out.kind = DedupKind::Recorded;
    out.canonical_attempt = out.attempt_id;
    spdlog::info("attempt {} on {} complete ({} fields{})", out.attempt_id, key.specimen,
                 result.fields.size(), key.forced ? ", forced" : "");
    return out;
  } catch (const IntegrityViolation& e) {
    // Lost the race: another writer completed this key first. Close our
    // attempt without its payload and move on.
    auto winner = index_.shouldExtract(key.specimen, key.params_hash, false).existing_attempt;
    out.canonical_attempt = winner;
    out.errors = {"duplicate of canonical attempt " + winner.value_or("unknown")};
    index_.failAttempt(out.attempt_id, out.errors, FieldSet{});
    out.kind = DedupKind::Duplicate;
    spdlog::info("attempt {} on {} discarded as duplicate: {}", out.attempt_id, key.specimen, e.what());
    return out;
  }
}

DedupOutcome AttemptDeduplicator::submit(const SpecimenIdentity& identity, const json& params,
                                         const EngineResult& result, bool failed, bool force) {
  const AttemptKey key = keyFor(identity, params, "external", force);

  DedupOutcome out;
  out.params_hash = key.params_hash;

  ExtractDecision decision = index_.shouldExtract(key.specimen, key.params_hash, force);
  if (!decision.extract) {
    out.kind = DedupKind::Skipped;
    out.canonical_attempt = decision.existing_attempt;
    return out;
  }

  if (failed) {
    out.errors = result.errors;
    if (out.errors.empty()) out.errors.push_back("reported failed by caller");
    EngineResult stored{malformation(result).empty() ? result.fields : FieldSet{}, out.errors};
    out.attempt_id = index_.recordAttempt(key, AttemptStatus::Failed, stored);
    out.kind = DedupKind::Failed;
    return out;
  }

  out.attempt_id = index_.beginAttempt(key);
  return complete(std::move(out), key, result);
}

} // namespace hbl
