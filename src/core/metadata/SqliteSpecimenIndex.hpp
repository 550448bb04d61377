#pragma once
#include <mutex>
#include <string>

#include "core/metadata/SpecimenIndex.hpp"

namespace hbl {

// SpecimenIndex over one SQLite connection. The database must have been
// created with initDatabase(). Calls on one instance are serialized; each
// worker thread or process should open its own instance so that the
// storage-level constraints, not this class, arbitrate between them.
class SqliteSpecimenIndex : public SpecimenIndex {
public:
  explicit SqliteSpecimenIndex(const std::string& dbPath);
  ~SqliteSpecimenIndex() override;

  SqliteSpecimenIndex(const SqliteSpecimenIndex&) = delete;
  SqliteSpecimenIndex& operator=(const SqliteSpecimenIndex&) = delete;

  bool registerSpecimen(const SpecimenIdentity& identity,
                        const std::string& source_ref) override;
  std::optional<Specimen> specimen(const SpecimenIdentity& identity) override;
  std::vector<SourceFile> sources(const SpecimenIdentity& identity) override;

  void registerTransformation(const Transformation& t) override;
  std::vector<Transformation> transformations(const SpecimenIdentity& identity) override;
  std::optional<SpecimenIdentity> resolveIdentity(const std::string& imageHash) override;

  ExtractDecision shouldExtract(const SpecimenIdentity& identity,
                                const ParamsHash& paramsHash,
                                bool force) override;
  std::string beginAttempt(const AttemptKey& key) override;
  void completeAttempt(const std::string& attemptId, const FieldSet& fields) override;
  void failAttempt(const std::string& attemptId, const std::vector<std::string>& errors,
                   const FieldSet& partial) override;
  std::string recordAttempt(const AttemptKey& key, AttemptStatus status,
                            const EngineResult& result) override;
  std::optional<ExtractionAttempt> attempt(const std::string& attemptId) override;
  std::vector<ExtractionAttempt> attempts(const SpecimenIdentity& identity) override;

  void saveAggregation(const AggregatedRecord& record) override;
  std::optional<std::string> catalogNumberOf(const SpecimenIdentity& identity) override;
  std::vector<SpecimenIdentity> queryByCatalogNumber(const std::string& value) override;
  std::vector<std::pair<std::string, std::vector<SpecimenIdentity>>> listDuplicates() override;

  void replaceFlags(const SpecimenIdentity& identity,
                    const std::vector<QualityFlag>& flags) override;
  std::vector<QualityFlag> flags(const SpecimenIdentity& identity, bool unresolvedOnly) override;
  bool resolveFlag(int64_t flagId) override;

  void attachReview(const ReviewReference& ref) override;
  std::optional<ReviewReference> review(const SpecimenIdentity& identity) override;

  SpecimenPage listSpecimens(const SpecimenFilter& filter) override;
  IndexStats stats() override;

private:
  void finishAttempt(const std::string& attemptId, AttemptStatus status,
                     const FieldSet& fields, const std::vector<std::string>& errors);
  int64_t count(const char* sql);

  void*      db_; // sqlite3*
  std::mutex mu_;
};

} // namespace hbl
