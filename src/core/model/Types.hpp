#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/model/Fields.hpp"

namespace hbl {

// Lowercase hex SHA-256 of the original image bytes.
using SpecimenIdentity = std::string;
// Lowercase hex SHA-256 of the canonical parameter JSON.
using ParamsHash = std::string;

enum class AttemptStatus { Pending, Complete, Failed };

const char* toString(AttemptStatus s);
AttemptStatus parseAttemptStatus(const std::string& s);

struct Specimen {
  SpecimenIdentity identity;
  int64_t          first_seen_at = 0;
};

struct SourceFile {
  SpecimenIdentity specimen;
  std::string      source_ref;
  int64_t          first_seen_at = 0;
};

struct Transformation {
  std::string      image_hash;     // hash of the derived image
  SpecimenIdentity specimen;
  std::string      derived_from;   // original identity or another derived hash
  std::string      operation;
  std::string      params_json;
  std::string      tool;
  std::string      tool_version;
  int64_t          created_at = 0;
};

struct ExtractionAttempt {
  std::string              id;
  SpecimenIdentity         specimen;
  std::string              provider;
  std::string              model;
  ParamsHash               params_hash;
  std::string              params_json;
  AttemptStatus            status = AttemptStatus::Pending;
  bool                     forced = false;
  FieldSet                 fields;
  std::vector<std::string> errors;
  int64_t                  created_at  = 0;
  int64_t                  finished_at = 0;
};

// What an extraction provider hands back.
struct EngineResult {
  FieldSet                 fields;
  std::vector<std::string> errors;
};

struct Candidate {
  std::string value;
  double      confidence = 0.0;
  std::string attempt_id;
  std::string provider;
  int64_t     created_at = 0;
};

struct SelectedField {
  std::string value;
  double      confidence = 0.0;
  std::string attempt_id;
  std::string provider;
  size_t      support = 0;  // attempts agreeing with value
};

struct AggregatedRecord {
  SpecimenIdentity                              specimen;
  std::map<DwcField, SelectedField>             fields;
  std::map<std::string, SelectedField>          extra;
  std::map<std::string, std::vector<Candidate>> conflicts;
  double                                        confidence = 0.0;
  size_t                                        attempt_count = 0;

  std::optional<std::string> value(DwcField f) const;
  std::optional<std::string> catalogNumber() const { return value(DwcField::CatalogNumber); }
};

enum class Severity { Low, Medium, High };

const char* toString(Severity s);
Severity parseSeverity(const std::string& s);

namespace flag_kind {
inline constexpr const char* FieldConflict          = "field_conflict";
inline constexpr const char* DuplicateCatalogNumber = "duplicate_catalog_number";
inline constexpr const char* MissingCoreField       = "missing_core_field";
inline constexpr const char* ImplausibleDate        = "implausible_date";
inline constexpr const char* MalformedCatalogNumber = "malformed_catalog_number";
inline constexpr const char* UnmappedField          = "unmapped_field";
} // namespace flag_kind

struct QualityFlag {
  int64_t          id = 0;
  SpecimenIdentity specimen;
  std::string      kind;
  Severity         severity = Severity::Medium;
  std::string      field;
  std::string      detail;
  int64_t          created_at = 0;
  bool             resolved = false;
};

// Pointer to a review decision held elsewhere; never interpreted here
// beyond its status string.
struct ReviewReference {
  SpecimenIdentity specimen;
  std::string      decision_ref;
  std::string      status;
  int64_t          recorded_at = 0;
};

struct SpecimenFilter {
  std::string                after;         // keyset cursor: identities > after
  size_t                     limit = 50;
  std::optional<std::string> flag_kind;     // only specimens with this unresolved flag
  std::optional<std::string> review_status;
  std::optional<std::string> catalog_number;
};

struct SpecimenSummary {
  SpecimenIdentity           identity;
  int64_t                    first_seen_at = 0;
  std::optional<std::string> catalog_number;
  size_t                     attempt_count = 0;
  size_t                     unresolved_flags = 0;
  std::optional<std::string> review_status;
};

struct SpecimenPage {
  std::vector<SpecimenSummary> items;
  std::string                  next_cursor;  // empty when exhausted
};

struct IndexStats {
  int64_t specimens = 0;
  int64_t sources = 0;
  int64_t transformations = 0;
  int64_t attempts_pending = 0;
  int64_t attempts_complete = 0;
  int64_t attempts_failed = 0;
  int64_t unresolved_flags = 0;
  int64_t reviews = 0;
};

} // namespace hbl
