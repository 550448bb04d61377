#include "core/model/Types.hpp"

#include "core/errors/Errors.hpp"

namespace hbl {

const char* toString(AttemptStatus s) {
  switch (s) {
    case AttemptStatus::Pending:  return "pending";
    case AttemptStatus::Complete: return "complete";
    case AttemptStatus::Failed:   return "failed";
  }
  return "pending";
}

AttemptStatus parseAttemptStatus(const std::string& s) {
  if (s == "pending")  return AttemptStatus::Pending;
  if (s == "complete") return AttemptStatus::Complete;
  if (s == "failed")   return AttemptStatus::Failed;
  throw StorageError("unknown attempt status: " + s);
}

const char* toString(Severity s) {
  switch (s) {
    case Severity::Low:    return "low";
    case Severity::Medium: return "medium";
    case Severity::High:   return "high";
  }
  return "medium";
}

Severity parseSeverity(const std::string& s) {
  if (s == "low")    return Severity::Low;
  if (s == "medium") return Severity::Medium;
  if (s == "high")   return Severity::High;
  throw ConfigurationError("unknown severity: " + s);
}

std::optional<std::string> AggregatedRecord::value(DwcField f) const {
  auto it = fields.find(f);
  if (it == fields.end()) return std::nullopt;
  return it->second.value;
}

} // namespace hbl
