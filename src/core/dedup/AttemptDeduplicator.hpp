#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/dedup/ExtractionEngine.hpp"
#include "core/metadata/SpecimenIndex.hpp"

namespace hbl {

enum class DedupKind {
  Skipped,    // a canonical completed attempt already exists; nothing ran
  Recorded,   // this call produced the canonical (or forced) completed attempt
  Failed,     // the extraction failed; recorded as a failed attempt
  Duplicate,  // lost the completion race; result discarded
};

const char* toString(DedupKind k);

struct DedupOutcome {
  DedupKind                  kind = DedupKind::Skipped;
  ParamsHash                 params_hash;
  std::string                attempt_id;          // attempt written by this call, if any
  std::optional<std::string> canonical_attempt;   // existing/winning completed attempt
  std::vector<std::string>   errors;
};

// Pairs SpecimenIndex::shouldExtract with the attempt write so callers
// never act on a stale "not yet extracted" answer. The final arbiter is the
// storage constraint: a caller that loses a race sees Duplicate, never two
// canonical attempts.
//
// A params set encoding provider/model/prompt version gives a new dedup
// key on every version bump. Re-running an unchanged key needs force.
class AttemptDeduplicator {
public:
  explicit AttemptDeduplicator(SpecimenIndex& index) : index_(index) {}

  // check -> pending attempt -> engine call -> terminal state.
  DedupOutcome run(const ImageRef& image, const nlohmann::json& params,
                   ExtractionEngine& engine, bool force = false);

  // Same guard for a result the caller obtained elsewhere. A result with
  // errors, no fields or out-of-range confidences is recorded as failed,
  // as is anything submitted with failed == true.
  DedupOutcome submit(const SpecimenIdentity& identity, const nlohmann::json& params,
                      const EngineResult& result, bool failed = false, bool force = false);

private:
  AttemptKey keyFor(const SpecimenIdentity& identity, const nlohmann::json& params,
                    const std::string& fallbackProvider, bool force) const;
  DedupOutcome complete(DedupOutcome out, const AttemptKey& key, const EngineResult& result);

  SpecimenIndex& index_;
};

} // namespace hbl
