#include "core/model/Json.hpp"

#include <cmath>
#include <string>

#include "core/errors/Errors.hpp"

using nlohmann::json;

namespace hbl {

namespace {

json parsedOrNull(const std::string& text) {
  if (text.empty()) return nullptr;
  try {
    return json::parse(text);
  } catch (const json::parse_error&) {
    return text;
  }
}

std::string scalarText(const json& v, const std::string& field) {
  if (v.is_null()) return std::string();
  if (v.is_string()) return v.get<std::string>();
  if (v.is_number() || v.is_boolean()) return v.dump();
  throw ConfigurationError("field '" + field + "': value must be a scalar");
}

double confidenceOf(const json& v, const std::string& field) {
  if (!v.is_number()) {
    throw ConfigurationError("field '" + field + "': confidence must be a number");
  }
  double c = v.get<double>();
  if (!std::isfinite(c) || c < 0.0 || c > 1.0) {
    throw ConfigurationError("field '" + field + "': confidence outside [0,1]");
  }
  return c;
}

json selectedToJson(const SelectedField& s) {
  return json{
    {"value", s.value},
    {"confidence", s.confidence},
    {"attempt_id", s.attempt_id},
    {"provider", s.provider},
    {"support", s.support}
  };
}

bool flagOf(const json& j, const char* key) {
  if (!j.contains(key)) return false;
  if (!j[key].is_boolean()) throw ConfigurationError(std::string(key) + " must be true or false");
  return j[key].get<bool>();
}

std::string stringOf(const json& j, const char* key, bool required) {
  if (!j.contains(key)) {
    if (required) throw ConfigurationError(std::string(key) + " is required");
    return std::string();
  }
  if (!j[key].is_string()) throw ConfigurationError(std::string(key) + " must be a string");
  return j[key].get<std::string>();
}

bool isHash(const std::string& s) {
  if (s.size() != 64) return false;
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

} // namespace

json fieldsToJson(const FieldSet& fields) {
  json out = json::object();
  for (const auto& [f, v] : fields.known) {
    out[fieldName(f)] = {{"value", v.value}, {"confidence", v.confidence}};
  }
  for (const auto& [name, v] : fields.extra) {
    out[name] = {{"value", v.value}, {"confidence", v.confidence}};
  }
  return out;
}

// Accepts {"name": {"value": v, "confidence": c}} or {"name": [v, c]}.
FieldSet fieldsFromJson(const json& j) {
  FieldSet out;
  if (j.is_null()) return out;
  if (!j.is_object()) throw ConfigurationError("fields must be a JSON object");
  for (const auto& [name, entry] : j.items()) {
    if (name.empty()) throw ConfigurationError("field name must not be empty");
    FieldValue v;
    if (entry.is_object()) {
      v.value = scalarText(entry.value("value", json()), name);
      v.confidence = entry.contains("confidence") ? confidenceOf(entry["confidence"], name) : 0.0;
    } else if (entry.is_array() && entry.size() == 2) {
      v.value = scalarText(entry[0], name);
      v.confidence = confidenceOf(entry[1], name);
    } else {
      throw ConfigurationError("field '" + name + "': expected {value, confidence}");
    }
    out.set(name, std::move(v));
  }
  return out;
}

EngineResult engineResultFromJson(const json& j) {
  if (!j.is_object()) throw ConfigurationError("extraction result must be a JSON object");
  EngineResult r;
  r.fields = fieldsFromJson(j.value("fields", json::object()));
  if (j.contains("errors")) {
    const auto& errs = j["errors"];
    if (!errs.is_array()) throw ConfigurationError("errors must be an array");
    for (const auto& e : errs) {
      r.errors.push_back(e.is_string() ? e.get<std::string>() : e.dump());
    }
  }
  return r;
}

AttemptSubmission attemptSubmissionFromJson(const json& j) {
  if (!j.is_object()) throw ConfigurationError("body must be a JSON object");
  AttemptSubmission s;
  if (j.contains("params")) {
    if (!j["params"].is_object()) throw ConfigurationError("params must be a JSON object");
    s.params = j["params"];
  }
  s.result = engineResultFromJson(j);
  s.failed = flagOf(j, "failed");
  s.force  = flagOf(j, "force");
  return s;
}

Transformation transformationFromJson(const SpecimenIdentity& specimen, const json& j) {
  if (!j.is_object()) throw ConfigurationError("body must be a JSON object");
  Transformation t;
  t.specimen     = specimen;
  t.image_hash   = stringOf(j, "image_hash", true);
  t.operation    = stringOf(j, "operation", true);
  t.derived_from = stringOf(j, "derived_from", false);
  if (t.derived_from.empty()) t.derived_from = specimen;
  t.tool         = stringOf(j, "tool", false);
  t.tool_version = stringOf(j, "tool_version", false);
  if (!isHash(t.image_hash)) throw ConfigurationError("image_hash must be 64 lowercase hex characters");
  if (!isHash(t.derived_from)) throw ConfigurationError("derived_from must be 64 lowercase hex characters");
  if (t.operation.empty()) throw ConfigurationError("operation must not be empty");
  if (j.contains("params")) {
    if (!j["params"].is_object()) throw ConfigurationError("params must be a JSON object");
    t.params_json = j["params"].dump();
  }
  return t;
}

json toJson(const ExtractionAttempt& a) {
  return json{
    {"id", a.id},
    {"specimen", a.specimen},
    {"provider", a.provider},
    {"model", a.model},
    {"params_hash", a.params_hash},
    {"params", parsedOrNull(a.params_json)},
    {"status", toString(a.status)},
    {"forced", a.forced},
    {"fields", fieldsToJson(a.fields)},
    {"errors", a.errors},
    {"created_at", a.created_at},
    {"finished_at", a.finished_at}
  };
}

json toJson(const AggregatedRecord& r) {
  json fields = json::object();
  for (const auto& [f, s] : r.fields) fields[fieldName(f)] = selectedToJson(s);
  json extra = json::object();
  for (const auto& [name, s] : r.extra) extra[name] = selectedToJson(s);
  json conflicts = json::object();
  for (const auto& [name, cands] : r.conflicts) {
    json arr = json::array();
    for (const auto& c : cands) {
      arr.push_back({
        {"value", c.value},
        {"confidence", c.confidence},
        {"attempt_id", c.attempt_id},
        {"provider", c.provider},
        {"created_at", c.created_at}
      });
    }
    conflicts[name] = std::move(arr);
  }
  return json{
    {"specimen", r.specimen},
    {"fields", std::move(fields)},
    {"extra", std::move(extra)},
    {"conflicts", std::move(conflicts)},
    {"confidence", r.confidence},
    {"attempt_count", r.attempt_count}
  };
}

json toJson(const QualityFlag& f) {
  return json{
    {"id", f.id},
    {"specimen", f.specimen},
    {"kind", f.kind},
    {"severity", toString(f.severity)},
    {"field", f.field},
    {"detail", f.detail},
    {"created_at", f.created_at},
    {"resolved", f.resolved}
  };
}

json toJson(const ReviewReference& r) {
  return json{
    {"specimen", r.specimen},
    {"decision_ref", r.decision_ref},
    {"status", r.status},
    {"recorded_at", r.recorded_at}
  };
}

json toJson(const Transformation& t) {
  return json{
    {"image_hash", t.image_hash},
    {"specimen", t.specimen},
    {"derived_from", t.derived_from},
    {"operation", t.operation},
    {"params", parsedOrNull(t.params_json)},
    {"tool", t.tool},
    {"tool_version", t.tool_version},
    {"created_at", t.created_at}
  };
}

json toJson(const SourceFile& s) {
  return json{
    {"specimen", s.specimen},
    {"source_ref", s.source_ref},
    {"first_seen_at", s.first_seen_at}
  };
}

json toJson(const SpecimenSummary& s) {
  json out{
    {"identity", s.identity},
    {"first_seen_at", s.first_seen_at},
    {"attempt_count", s.attempt_count},
    {"unresolved_flags", s.unresolved_flags}
  };
  out["catalog_number"] = s.catalog_number ? json(*s.catalog_number) : json(nullptr);
  out["review_status"]  = s.review_status ? json(*s.review_status) : json(nullptr);
  return out;
}

json toJson(const IndexStats& s) {
  return json{
    {"specimens", s.specimens},
    {"sources", s.sources},
    {"transformations", s.transformations},
    {"attempts", {
      {"pending", s.attempts_pending},
      {"complete", s.attempts_complete},
      {"failed", s.attempts_failed}
    }},
    {"unresolved_flags", s.unresolved_flags},
    {"reviews", s.reviews}
  };
}

} // namespace hbl
