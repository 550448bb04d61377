#pragma once
#include <optional>
#include <utility>
#include <string>
#include <vector>

#include "core/model/Types.hpp"

namespace hbl {

struct ExtractDecision {
  bool                       extract = true;
  std::optional<std::string> existing_attempt;  // canonical completed, else latest failed
};

// Parameters identifying one attempt's dedup key.
struct AttemptKey {
  SpecimenIdentity specimen;
  std::string      provider;
  std::string      model;
  ParamsHash       params_hash;
  std::string      params_json;
  bool             forced = false;
};

// Persistent store of specimens and everything attached to them. One
// implementation (SQLite); tests/test_specimen_index_contract.cpp is the
// contract every implementation must pass.
//
// Attempts are append-only. The canonical-completion constraint lives in
// the storage layer so it holds across processes: a writer that loses the
// race gets IntegrityViolation.
class SpecimenIndex {
public:
  virtual ~SpecimenIndex() = default;

  // Returns true if the specimen was created. Re-registering is a no-op
  // apart from recording a new source_ref edge.
  virtual bool registerSpecimen(const SpecimenIdentity& identity,
                                const std::string& source_ref) = 0;
  virtual std::optional<Specimen> specimen(const SpecimenIdentity& identity) = 0;
  virtual std::vector<SourceFile> sources(const SpecimenIdentity& identity) = 0;

  virtual void registerTransformation(const Transformation& t) = 0;
  virtual std::vector<Transformation> transformations(const SpecimenIdentity& identity) = 0;
  // Maps an original or derived image hash to its specimen.
  virtual std::optional<SpecimenIdentity> resolveIdentity(const std::string& imageHash) = 0;

  virtual ExtractDecision shouldExtract(const SpecimenIdentity& identity,
                                        const ParamsHash& paramsHash,
                                        bool force) = 0;

  // Appends a pending attempt and returns its id.
  virtual std::string beginAttempt(const AttemptKey& key) = 0;
  // pending -> complete. Throws IntegrityViolation if the attempt is not
  // pending or a canonical completed attempt already exists for the key.
  virtual void completeAttempt(const std::string& attemptId, const FieldSet& fields) = 0;
  // pending -> failed, keeping any partial payload for provenance. Throws
  // IntegrityViolation if not pending.
  virtual void failAttempt(const std::string& attemptId, const std::vector<std::string>& errors,
                           const FieldSet& partial) = 0;
  // Appends an already-terminal attempt in one statement. Same
  // IntegrityViolation contract as completeAttempt.
  virtual std::string recordAttempt(const AttemptKey& key, AttemptStatus status,
                                    const EngineResult& result) = 0;

  virtual std::optional<ExtractionAttempt> attempt(const std::string& attemptId) = 0;
  // All attempts for the specimen, oldest first, any status.
  virtual std::vector<ExtractionAttempt> attempts(const SpecimenIdentity& identity) = 0;

  virtual void saveAggregation(const AggregatedRecord& record) = 0;
  // Normalized catalogNumber of the last saved aggregation, if any.
  virtual std::optional<std::string> catalogNumberOf(const SpecimenIdentity& identity) = 0;
  // Specimens whose last aggregation selected this catalogNumber.
  virtual std::vector<SpecimenIdentity> queryByCatalogNumber(const std::string& value) = 0;
  // catalogNumber -> holders, for every value held by more than one specimen.
  virtual std::vector<std::pair<std::string, std::vector<SpecimenIdentity>>> listDuplicates() = 0;

  // Swaps the unresolved flags of a specimen for a freshly computed set.
  // Flags matching a resolved one (kind, field, detail) are not re-raised.
  virtual void replaceFlags(const SpecimenIdentity& identity,
                            const std::vector<QualityFlag>& flags) = 0;
  virtual std::vector<QualityFlag> flags(const SpecimenIdentity& identity,
                                         bool unresolvedOnly) = 0;
  virtual bool resolveFlag(int64_t flagId) = 0;

  virtual void attachReview(const ReviewReference& ref) = 0;
  virtual std::optional<ReviewReference> review(const SpecimenIdentity& identity) = 0;

  virtual SpecimenPage listSpecimens(const SpecimenFilter& filter) = 0;
  virtual IndexStats stats() = 0;
};

} // namespace hbl
