#pragma once
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include "core/config/Config.hpp"
#include "core/model/Types.hpp"

namespace hbl {

// Runs the configured rule set over one aggregated record. Flags are
// advisory; the auditor never edits the record.
class QualityAuditor {
public:
  explicit QualityAuditor(AuditConfig cfg);

  // catalogHolders: every specimen whose current aggregation carries the
  // same catalogNumber, this one included.
  std::vector<QualityFlag> audit(const AggregatedRecord& record,
                                 const std::vector<SpecimenIdentity>& catalogHolders) const;

  // Year of a label date ("1923-05-14", "14 May 1923", "1923"), if one
  // can be read and the calendar parts are sane.
  static std::optional<int> parseYear(const std::string& value);

  int maxYear() const;

private:
  void checkDuplicate(const AggregatedRecord& r, const std::vector<SpecimenIdentity>& holders,
                      std::vector<QualityFlag>& out) const;
  void checkCoreFields(const AggregatedRecord& r, std::vector<QualityFlag>& out) const;
  void checkDates(const AggregatedRecord& r, std::vector<QualityFlag>& out) const;
  void checkCatalogFormat(const AggregatedRecord& r, std::vector<QualityFlag>& out) const;
  void checkUnmapped(const AggregatedRecord& r, std::vector<QualityFlag>& out) const;

  AuditConfig               cfg_;
  std::optional<std::regex> catalogRe_;
  std::set<std::string>     extraTerms_;
};

} // namespace hbl
