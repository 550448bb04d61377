#include "core/metadata/SqliteSpecimenIndex.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <tuple>

#include "core/errors/Errors.hpp"
#include "core/model/Json.hpp"
#include "core/util/Ids.hpp"

using nlohmann::json;

namespace hbl {

namespace {

[[noreturn]] void throwFor(sqlite3* db, int rc, const std::string& what) {
  std::string err = sqlite3_errmsg(db);
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    if (rc == SQLITE_CONSTRAINT_FOREIGNKEY) {
      throw StorageError(what + ": unknown specimen (" + err + ")");
    }
    throw IntegrityViolation(what + ": " + err);
  }
  throw StorageError(what + " failed: " + err);
}

void execAll(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw StorageError(std::string("SQLite exec failed: ") + msg);
  }
}

class Stmt {
public:
  Stmt(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      std::string err = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw StorageError("prepare failed: " + err);
    }
  }
  ~Stmt() { sqlite3_finalize(st_); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  void bind(int i, const std::string& v) { sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT); }
  void bind(int i, int64_t v)            { sqlite3_bind_int64(st_, i, v); }
  void bindNull(int i)                   { sqlite3_bind_null(st_, i); }

  // true on SQLITE_ROW, false on SQLITE_DONE.
  bool step(const char* what) {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throwFor(db_, rc, what);
  }
  void run(const char* what) { while (step(what)) {} }

  std::string text(int c) const {
    auto* p = sqlite3_column_text(st_, c);
    return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
  }
  std::optional<std::string> optText(int c) const {
    if (sqlite3_column_type(st_, c) == SQLITE_NULL) return std::nullopt;
    return text(c);
  }
  int64_t i64(int c) const { return sqlite3_column_int64(st_, c); }

private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

// BEGIN IMMEDIATE takes the write lock up front so two writers serialize on
// busy_timeout instead of deadlocking on upgrade.
class Tx {
public:
  explicit Tx(sqlite3* db) : db_(db) { execAll(db_, "BEGIN IMMEDIATE;"); }
  ~Tx() { if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr); }
  void commit() { execAll(db_, "COMMIT;"); done_ = true; }
private:
  sqlite3* db_;
  bool     done_ = false;
};

const char* kAttemptColumns =
  "id, specimen_identity, provider, model, params_hash, params, status, forced, "
  "fields, errors, created_at, finished_at";

ExtractionAttempt readAttempt(const Stmt& st) {
  ExtractionAttempt a;
  a.id          = st.text(0);
  a.specimen    = st.text(1);
  a.provider    = st.text(2);
  a.model       = st.text(3);
  a.params_hash = st.text(4);
  a.params_json = st.text(5);
  a.status      = parseAttemptStatus(st.text(6));
  a.forced      = st.i64(7) != 0;
  try {
    a.fields = fieldsFromJson(json::parse(st.text(8)));
    for (const auto& e : json::parse(st.text(9))) a.errors.push_back(e.get<std::string>());
  } catch (const std::exception& e) {
    throw StorageError("attempt " + a.id + " has corrupt payload: " + e.what());
  }
  a.created_at  = st.i64(10);
  a.finished_at = st.i64(11);
  return a;
}

Transformation readTransformation(const Stmt& st) {
  Transformation t;
  t.image_hash   = st.text(0);
  t.specimen     = st.text(1);
  t.derived_from = st.text(2);
  t.operation    = st.text(3);
  t.params_json  = st.text(4);
  t.tool         = st.text(5);
  t.tool_version = st.text(6);
  t.created_at   = st.i64(7);
  return t;
}

QualityFlag readFlag(const Stmt& st) {
  QualityFlag f;
  f.id         = st.i64(0);
  f.specimen   = st.text(1);
  f.kind       = st.text(2);
  f.severity   = parseSeverity(st.text(3));
  f.field      = st.text(4);
  f.detail     = st.text(5);
  f.created_at = st.i64(6);
  f.resolved   = st.i64(7) != 0;
  return f;
}

// Provider text is not guaranteed to be valid UTF-8.
std::string storedJson(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string errorsJson(const std::vector<std::string>& errors) {
  return storedJson(json(errors));
}

} // namespace

SqliteSpecimenIndex::SqliteSpecimenIndex(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    std::string err = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StorageError("failed to open db " + dbPath + ": " + err);
  }
  sqlite3_extended_result_codes(db, 1);
  sqlite3_busy_timeout(db, 5000);
  try {
    execAll(db, "PRAGMA foreign_keys=ON;");
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
  db_ = db;
}

SqliteSpecimenIndex::~SqliteSpecimenIndex() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

bool SqliteSpecimenIndex::registerSpecimen(const SpecimenIdentity& identity,
                                           const std::string& source_ref) {
  if (identity.empty()) throw ConfigurationError("specimen identity must not be empty");
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const int64_t now = nowMillis();
  Tx tx(db);

  Stmt ins(db, "INSERT OR IGNORE INTO specimens (identity, first_seen_at) VALUES (?,?)");
  ins.bind(1, identity);
  ins.bind(2, now);
  ins.run("registerSpecimen");
  const bool created = sqlite3_changes(db) > 0;

  if (!source_ref.empty()) {
    Stmt src(db, R"SQL(
      INSERT OR IGNORE INTO specimen_sources (specimen_identity, source_ref, first_seen_at)
      VALUES (?,?,?)
    )SQL");
    src.bind(1, identity);
    src.bind(2, source_ref);
    src.bind(3, now);
    src.run("registerSpecimen source");
  }
  tx.commit();

  if (created) spdlog::debug("specimen {} registered", identity);
  return created;
}

std::optional<Specimen> SqliteSpecimenIndex::specimen(const SpecimenIdentity& identity) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_),
          "SELECT identity, first_seen_at FROM specimens WHERE identity = ?");
  st.bind(1, identity);
  if (!st.step("specimen")) return std::nullopt;
  return Specimen{st.text(0), st.i64(1)};
}

std::vector<SourceFile> SqliteSpecimenIndex::sources(const SpecimenIdentity& identity) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    SELECT specimen_identity, source_ref, first_seen_at FROM specimen_sources
    WHERE specimen_identity = ? ORDER BY first_seen_at, source_ref
  )SQL");
  st.bind(1, identity);
  std::vector<SourceFile> out;
  while (st.step("sources")) out.push_back(SourceFile{st.text(0), st.text(1), st.i64(2)});
  return out;
}

void SqliteSpecimenIndex::registerTransformation(const Transformation& t) {
  if (t.image_hash.empty() || t.derived_from.empty()) {
    throw ConfigurationError("transformation needs image_hash and derived_from");
  }
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Tx tx(db);

  Stmt ins(db, R"SQL(
    INSERT INTO image_transformations
      (image_hash, specimen_identity, derived_from, operation, params, tool, tool_version, created_at)
    VALUES (?,?,?,?,?,?,?,?)
    ON CONFLICT(image_hash) DO NOTHING
  )SQL");
  int i = 1;
  ins.bind(i++, t.image_hash);
  ins.bind(i++, t.specimen);
  ins.bind(i++, t.derived_from);
  ins.bind(i++, t.operation);
  ins.bind(i++, t.params_json.empty() ? std::string("{}") : t.params_json);
  ins.bind(i++, t.tool);
  ins.bind(i++, t.tool_version);
  ins.bind(i++, t.created_at ? t.created_at : nowMillis());
  ins.run("registerTransformation");

  if (sqlite3_changes(db) == 0) {
    std::string owner;
    {
      Stmt chk(db, "SELECT specimen_identity FROM image_transformations WHERE image_hash = ?");
      chk.bind(1, t.image_hash);
      if (chk.step("registerTransformation check")) owner = chk.text(0);
    }
    if (!owner.empty() && owner != t.specimen) {
      throw IntegrityViolation("derived image " + t.image_hash + " already belongs to specimen " + owner);
    }
  }
  tx.commit();
}

std::vector<Transformation> SqliteSpecimenIndex::transformations(const SpecimenIdentity& identity) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    SELECT image_hash, specimen_identity, derived_from, operation, params, tool, tool_version, created_at
    FROM image_transformations WHERE specimen_identity = ? ORDER BY created_at, image_hash
  )SQL");
  st.bind(1, identity);
  std::vector<Transformation> out;
  while (st.step("transformations")) out.push_back(readTransformation(st));
  return out;
}

std::optional<SpecimenIdentity> SqliteSpecimenIndex::resolveIdentity(const std::string& imageHash) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Stmt st(db, R"SQL(
    SELECT identity FROM specimens WHERE identity = ?1
    UNION ALL
    SELECT specimen_identity FROM image_transformations WHERE image_hash = ?1
    LIMIT 1
  )SQL");
  st.bind(1, imageHash);
  if (!st.step("resolveIdentity")) return std::nullopt;
  return st.text(0);
}

ExtractDecision SqliteSpecimenIndex::shouldExtract(const SpecimenIdentity& identity,
                                                   const ParamsHash& paramsHash,
                                                   bool force) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);

  Stmt done(db, R"SQL(
    SELECT id FROM extraction_attempts
    WHERE specimen_identity = ? AND params_hash = ? AND status = 'complete'
    ORDER BY forced ASC, created_at DESC, id ASC LIMIT 1
  )SQL");
  done.bind(1, identity);
  done.bind(2, paramsHash);
  if (done.step("shouldExtract")) return ExtractDecision{force, done.text(0)};

  Stmt failed(db, R"SQL(
    SELECT id FROM extraction_attempts
    WHERE specimen_identity = ? AND params_hash = ? AND status = 'failed'
    ORDER BY created_at DESC, id ASC LIMIT 1
  )SQL");
  failed.bind(1, identity);
  failed.bind(2, paramsHash);
  if (failed.step("shouldExtract")) return ExtractDecision{true, failed.text(0)};
  return ExtractDecision{true, std::nullopt};
}

std::string SqliteSpecimenIndex::beginAttempt(const AttemptKey& key) {
  EngineResult empty;
  return recordAttempt(key, AttemptStatus::Pending, empty);
}

std::string SqliteSpecimenIndex::recordAttempt(const AttemptKey& key, AttemptStatus status,
                                               const EngineResult& result) {
  if (key.params_hash.empty()) throw ConfigurationError("attempt needs a params hash");
  if (key.provider.empty()) throw ConfigurationError("attempt needs a provider name");
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);

  const std::string id = uuid4();
  const int64_t now = nowMillis();
  Tx tx(db);
  Stmt st(db, R"SQL(
    INSERT INTO extraction_attempts
      (id, specimen_identity, provider, model, params_hash, params, status, forced,
       fields, errors, created_at, finished_at)
    VALUES (?,?,?,?,?,?,?,?,?,?,?,?)
  )SQL");
  int i = 1;
  st.bind(i++, id);
  st.bind(i++, key.specimen);
  st.bind(i++, key.provider);
  st.bind(i++, key.model);
  st.bind(i++, key.params_hash);
  st.bind(i++, key.params_json.empty() ? std::string("{}") : key.params_json);
  st.bind(i++, std::string(toString(status)));
  st.bind(i++, static_cast<int64_t>(key.forced ? 1 : 0));
  // Failed attempts keep whatever partial payload the provider returned.
  st.bind(i++, storedJson(fieldsToJson(result.fields)));
  st.bind(i++, errorsJson(result.errors));
  st.bind(i++, now);
  st.bind(i++, status == AttemptStatus::Pending ? int64_t{0} : now);
  st.run("recordAttempt");
  tx.commit();

  spdlog::debug("attempt {} for {} recorded as {}", id, key.specimen, toString(status));
  return id;
}

void SqliteSpecimenIndex::completeAttempt(const std::string& attemptId, const FieldSet& fields) {
  finishAttempt(attemptId, AttemptStatus::Complete, fields, {});
}

void SqliteSpecimenIndex::failAttempt(const std::string& attemptId,
                                      const std::vector<std::string>& errors,
                                      const FieldSet& partial) {
  finishAttempt(attemptId, AttemptStatus::Failed, partial, errors);
}

void SqliteSpecimenIndex::finishAttempt(const std::string& attemptId, AttemptStatus status,
                                        const FieldSet& fields,
                                        const std::vector<std::string>& errors) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Tx tx(db);
  // The terminal trigger and the canonical unique index both fire inside
  // this single statement.
  Stmt st(db, R"SQL(
    UPDATE extraction_attempts
    SET status = ?, fields = ?, errors = ?, finished_at = ?
    WHERE id = ?
  )SQL");
  st.bind(1, std::string(toString(status)));
  st.bind(2, storedJson(fieldsToJson(fields)));
  st.bind(3, errorsJson(errors));
  st.bind(4, nowMillis());
  st.bind(5, attemptId);
  st.run("finishAttempt");
  if (sqlite3_changes(db) == 0) throw StorageError("no such attempt: " + attemptId);
  tx.commit();
}

std::optional<ExtractionAttempt> SqliteSpecimenIndex::attempt(const std::string& attemptId) {
  std::lock_guard<std::mutex> lock(mu_);
  const std::string sql = std::string("SELECT ") + kAttemptColumns +
                          " FROM extraction_attempts WHERE id = ?";
  Stmt st(static_cast<sqlite3*>(db_), sql.c_str());
  st.bind(1, attemptId);
  if (!st.step("attempt")) return std::nullopt;
  return readAttempt(st);
}

std::vector<ExtractionAttempt> SqliteSpecimenIndex::attempts(const SpecimenIdentity& identity) {
  std::lock_guard<std::mutex> lock(mu_);
  const std::string sql = std::string("SELECT ") + kAttemptColumns +
                          " FROM extraction_attempts WHERE specimen_identity = ?"
                          " ORDER BY created_at, id";
  Stmt st(static_cast<sqlite3*>(db_), sql.c_str());
  st.bind(1, identity);
  std::vector<ExtractionAttempt> out;
  while (st.step("attempts")) out.push_back(readAttempt(st));
  return out;
}

void SqliteSpecimenIndex::saveAggregation(const AggregatedRecord& record) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    INSERT INTO specimen_aggregations (specimen_identity, catalog_number, record, computed_at)
    VALUES (?,?,?,?)
    ON CONFLICT(specimen_identity) DO UPDATE SET
      catalog_number = excluded.catalog_number,
      record         = excluded.record,
      computed_at    = excluded.computed_at
  )SQL");
  st.bind(1, record.specimen);
  auto catalog = record.catalogNumber();
  if (catalog) st.bind(2, normalizeValue(*catalog)); else st.bindNull(2);
  st.bind(3, storedJson(toJson(record)));
  st.bind(4, nowMillis());
  st.run("saveAggregation");
}

std::optional<std::string> SqliteSpecimenIndex::catalogNumberOf(const SpecimenIdentity& identity) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_),
          "SELECT catalog_number FROM specimen_aggregations WHERE specimen_identity = ?");
  st.bind(1, identity);
  if (!st.step("catalogNumberOf")) return std::nullopt;
  return st.optText(0);
}

std::vector<SpecimenIdentity> SqliteSpecimenIndex::queryByCatalogNumber(const std::string& value) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    SELECT specimen_identity FROM specimen_aggregations
    WHERE catalog_number = ? ORDER BY specimen_identity
  )SQL");
  st.bind(1, normalizeValue(value));
  std::vector<SpecimenIdentity> out;
  while (st.step("queryByCatalogNumber")) out.push_back(st.text(0));
  return out;
}

std::vector<std::pair<std::string, std::vector<SpecimenIdentity>>>
SqliteSpecimenIndex::listDuplicates() {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    SELECT catalog_number, specimen_identity FROM specimen_aggregations
    WHERE catalog_number IN (
      SELECT catalog_number FROM specimen_aggregations
      WHERE catalog_number IS NOT NULL
      GROUP BY catalog_number HAVING COUNT(*) > 1)
    ORDER BY catalog_number, specimen_identity
  )SQL");
  std::vector<std::pair<std::string, std::vector<SpecimenIdentity>>> out;
  while (st.step("listDuplicates")) {
    std::string catalog = st.text(0);
    if (out.empty() || out.back().first != catalog) out.emplace_back(catalog, std::vector<SpecimenIdentity>{});
    out.back().second.push_back(st.text(1));
  }
  return out;
}

void SqliteSpecimenIndex::replaceFlags(const SpecimenIdentity& identity,
                                       const std::vector<QualityFlag>& flags) {
  using Key = std::tuple<std::string, std::string, std::string>;
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Tx tx(db);

  // Open flags whose (kind, field, detail) is still raised keep their row,
  // id and created_at. Only the difference is written.
  std::set<Key> resolved;
  std::map<Key, int64_t> raised;
  std::vector<int64_t> stale;
  {
    Stmt st(db, "SELECT id, kind, field, detail, resolved FROM quality_flags "
                "WHERE specimen_identity = ? ORDER BY id");
    st.bind(1, identity);
    while (st.step("replaceFlags current")) {
      Key key(st.text(1), st.text(2), st.text(3));
      if (st.i64(4)) {
        resolved.insert(std::move(key));
      } else if (!raised.emplace(std::move(key), st.i64(0)).second) {
        stale.push_back(st.i64(0));
      }
    }
  }

  std::set<Key> wanted;
  const int64_t now = nowMillis();
  for (const auto& f : flags) {
    Key key(f.kind, f.field, f.detail);
    if (resolved.count(key) || !wanted.insert(key).second) continue;
    if (raised.count(key)) continue;
    Stmt ins(db, R"SQL(
      INSERT INTO quality_flags (specimen_identity, kind, severity, field, detail, created_at, resolved)
      VALUES (?,?,?,?,?,?,0)
    )SQL");
    int i = 1;
    ins.bind(i++, identity);
    ins.bind(i++, f.kind);
    ins.bind(i++, std::string(toString(f.severity)));
    ins.bind(i++, f.field);
    ins.bind(i++, f.detail);
    ins.bind(i++, f.created_at ? f.created_at : now);
    ins.run("replaceFlags insert");
  }

  for (const auto& [key, id] : raised) {
    if (!wanted.count(key)) stale.push_back(id);
  }
  for (int64_t id : stale) {
    Stmt del(db, "DELETE FROM quality_flags WHERE id = ?");
    del.bind(1, id);
    del.run("replaceFlags delete");
  }
  tx.commit();
}

std::vector<QualityFlag> SqliteSpecimenIndex::flags(const SpecimenIdentity& identity,
                                                    bool unresolvedOnly) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), unresolvedOnly
    ? "SELECT id, specimen_identity, kind, severity, field, detail, created_at, resolved "
      "FROM quality_flags WHERE specimen_identity = ? AND resolved = 0 ORDER BY id"
    : "SELECT id, specimen_identity, kind, severity, field, detail, created_at, resolved "
      "FROM quality_flags WHERE specimen_identity = ? ORDER BY id");
  st.bind(1, identity);
  std::vector<QualityFlag> out;
  while (st.step("flags")) out.push_back(readFlag(st));
  return out;
}

bool SqliteSpecimenIndex::resolveFlag(int64_t flagId) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Stmt st(db, "UPDATE quality_flags SET resolved = 1 WHERE id = ? AND resolved = 0");
  st.bind(1, flagId);
  st.run("resolveFlag");
  return sqlite3_changes(db) > 0;
}

void SqliteSpecimenIndex::attachReview(const ReviewReference& ref) {
  if (ref.decision_ref.empty()) throw ConfigurationError("review reference must not be empty");
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    INSERT INTO review_references (specimen_identity, decision_ref, status, recorded_at)
    VALUES (?,?,?,?)
    ON CONFLICT(specimen_identity) DO UPDATE SET
      decision_ref = excluded.decision_ref,
      status       = excluded.status,
      recorded_at  = excluded.recorded_at
  )SQL");
  st.bind(1, ref.specimen);
  st.bind(2, ref.decision_ref);
  st.bind(3, ref.status);
  st.bind(4, ref.recorded_at ? ref.recorded_at : nowMillis());
  st.run("attachReview");
}

std::optional<ReviewReference> SqliteSpecimenIndex::review(const SpecimenIdentity& identity) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    SELECT specimen_identity, decision_ref, status, recorded_at
    FROM review_references WHERE specimen_identity = ?
  )SQL");
  st.bind(1, identity);
  if (!st.step("review")) return std::nullopt;
  return ReviewReference{st.text(0), st.text(1), st.text(2), st.i64(3)};
}

SpecimenPage SqliteSpecimenIndex::listSpecimens(const SpecimenFilter& filter) {
  const size_t limit = filter.limit == 0 ? 50 : std::min<size_t>(filter.limit, 1000);

  std::string sql = R"SQL(
    SELECT s.identity, s.first_seen_at, a.record,
      (SELECT COUNT(*) FROM extraction_attempts e WHERE e.specimen_identity = s.identity),
      (SELECT COUNT(*) FROM quality_flags q WHERE q.specimen_identity = s.identity AND q.resolved = 0),
      r.status
    FROM specimens s
    LEFT JOIN specimen_aggregations a ON a.specimen_identity = s.identity
    LEFT JOIN review_references r ON r.specimen_identity = s.identity
    WHERE s.identity > ?1
  )SQL";
  if (filter.flag_kind) {
    sql += " AND EXISTS (SELECT 1 FROM quality_flags q WHERE q.specimen_identity = s.identity"
           " AND q.resolved = 0 AND q.kind = ?2)";
  }
  if (filter.review_status) sql += " AND r.status = ?3";
  if (filter.catalog_number) sql += " AND a.catalog_number = ?4";
  sql += " ORDER BY s.identity LIMIT ?5";

  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), sql.c_str());
  st.bind(1, filter.after);
  if (filter.flag_kind) st.bind(2, *filter.flag_kind);
  if (filter.review_status) st.bind(3, *filter.review_status);
  if (filter.catalog_number) st.bind(4, normalizeValue(*filter.catalog_number));
  st.bind(5, static_cast<int64_t>(limit + 1));

  SpecimenPage page;
  while (st.step("listSpecimens")) {
    if (page.items.size() == limit) {
      page.next_cursor = page.items.back().identity;
      break;
    }
    SpecimenSummary s;
    s.identity      = st.text(0);
    s.first_seen_at = st.i64(1);
    if (auto rec = st.optText(2)) {
      auto j = json::parse(*rec, nullptr, false);
      if (!j.is_discarded() && j.contains("fields") && j["fields"].contains("catalogNumber")) {
        s.catalog_number = j["fields"]["catalogNumber"].value("value", std::string());
      }
    }
    s.attempt_count    = static_cast<size_t>(st.i64(3));
    s.unresolved_flags = static_cast<size_t>(st.i64(4));
    s.review_status    = st.optText(5);
    page.items.push_back(std::move(s));
  }
  return page;
}

int64_t SqliteSpecimenIndex::count(const char* sql) {
  Stmt st(static_cast<sqlite3*>(db_), sql);
  return st.step("stats") ? st.i64(0) : 0;
}

IndexStats SqliteSpecimenIndex::stats() {
  std::lock_guard<std::mutex> lock(mu_);
  IndexStats s;
  s.specimens         = count("SELECT COUNT(*) FROM specimens");
  s.sources           = count("SELECT COUNT(*) FROM specimen_sources");
  s.transformations   = count("SELECT COUNT(*) FROM image_transformations");
  s.attempts_pending  = count("SELECT COUNT(*) FROM extraction_attempts WHERE status = 'pending'");
  s.attempts_complete = count("SELECT COUNT(*) FROM extraction_attempts WHERE status = 'complete'");
  s.attempts_failed   = count("SELECT COUNT(*) FROM extraction_attempts WHERE status = 'failed'");
  s.unresolved_flags  = count("SELECT COUNT(*) FROM quality_flags WHERE resolved = 0");
  s.reviews           = count("SELECT COUNT(*) FROM review_references");
  return s;
}

} // namespace hbl
