#pragma once
#include <nlohmann/json.hpp>

#include "core/model/Types.hpp"

namespace hbl {

// Wire and storage form of the model. Parsers throw ConfigurationError on
// malformed input.

nlohmann::json fieldsToJson(const FieldSet& fields);
FieldSet fieldsFromJson(const nlohmann::json& j);

EngineResult engineResultFromJson(const nlohmann::json& j);

// Result computed outside the process, as posted by a client:
// {"params": {...}, "fields": {...}, "errors": [...], "failed": false, "force": false}
struct AttemptSubmission {
  nlohmann::json params = nlohmann::json::object();
  EngineResult   result;
  bool           failed = false;
  bool           force  = false;
};
AttemptSubmission attemptSubmissionFromJson(const nlohmann::json& j);

// {"image_hash": "<64 hex>", "operation": "crop_label", "derived_from"?,
//  "params"?, "tool"?, "tool_version"?}. derived_from defaults to specimen.
Transformation transformationFromJson(const SpecimenIdentity& specimen, const nlohmann::json& j);

nlohmann::json toJson(const ExtractionAttempt& a);
nlohmann::json toJson(const AggregatedRecord& r);
nlohmann::json toJson(const QualityFlag& f);
nlohmann::json toJson(const ReviewReference& r);
nlohmann::json toJson(const Transformation& t);
nlohmann::json toJson(const SourceFile& s);
nlohmann::json toJson(const SpecimenSummary& s);
nlohmann::json toJson(const IndexStats& s);

} // namespace hbl
