#include "core/quality/QualityAuditor.hpp"

#include <cctype>
#include <ctime>

#include "core/errors/Errors.hpp"

namespace hbl {

namespace {

QualityFlag makeFlag(const AggregatedRecord& r, const char* kind, Severity sev,
                     const std::string& field, std::string detail) {
  QualityFlag f;
  f.specimen = r.specimen;
  f.kind     = kind;
  f.severity = sev;
  f.field    = field;
  f.detail   = std::move(detail);
  return f;
}

std::optional<std::string> valueOf(const AggregatedRecord& r, const std::string& name) {
  if (auto f = parseField(name)) return r.value(*f);
  auto it = r.extra.find(name);
  if (it == r.extra.end()) return std::nullopt;
  return it->second.value;
}

// Label text longer than this is never a date or a catalog number, and is
// kept away from std::regex.
constexpr size_t kMaxAuditedLength = 256;

std::string clip(const std::string& v) {
  return v.size() <= 64 ? v : v.substr(0, 64) + "...";
}

int currentYear() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  return tm.tm_year + 1900;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

// Reads 1..maxDigits digits at pos; returns -1 if there are none or more.
int readNumber(const std::string& s, size_t& pos, size_t maxDigits) {
  size_t start = pos;
  int v = 0;
  while (pos < s.size() && isDigit(s[pos])) {
    if (pos - start == maxDigits) return -1;
    v = v * 10 + (s[pos] - '0');
    ++pos;
  }
  return pos == start ? -1 : v;
}

// "YYYY-M[M][-D[D]]" optionally followed by T, space or '/' and anything.
// Returns 0 if the value is not shaped like that, -1 if it is but the
// calendar parts are out of range, else the year.
int isoYear(const std::string& s) {
  size_t pos = 0;
  while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
  size_t start = pos;
  const int year = readNumber(s, pos, 4);
  if (year < 0 || pos - start != 4 || pos >= s.size() || s[pos] != '-') return 0;
  ++pos;
  const int month = readNumber(s, pos, 2);
  if (month < 0) return 0;
  int day = 1;
  if (pos < s.size() && s[pos] == '-') {
    ++pos;
    day = readNumber(s, pos, 2);
    if (day < 0) return 0;
  }
  if (pos < s.size() && s[pos] != 'T' && s[pos] != ' ' && s[pos] != '/') return 0;
  if (month < 1 || month > 12 || day < 1 || day > 31) return -1;
  return year;
}

} // namespace

QualityAuditor::QualityAuditor(AuditConfig cfg) : cfg_(std::move(cfg)) {
  if (!cfg_.catalog_pattern.empty()) {
    try {
      catalogRe_.emplace(cfg_.catalog_pattern);
    } catch (const std::regex_error& e) {
      throw ConfigurationError("invalid catalog_pattern: " + std::string(e.what()));
    }
  }
  extraTerms_.insert(cfg_.extra_terms.begin(), cfg_.extra_terms.end());
}

int QualityAuditor::maxYear() const {
  return cfg_.max_year ? cfg_.max_year : currentYear();
}

std::optional<int> QualityAuditor::parseYear(const std::string& value) {
  const int iso = isoYear(value);
  if (iso < 0) return std::nullopt;
  if (iso > 0) return iso;

  // First run of exactly four digits.
  size_t pos = 0;
  while (pos < value.size()) {
    if (!isDigit(value[pos])) { ++pos; continue; }
    size_t start = pos;
    while (pos < value.size() && isDigit(value[pos])) ++pos;
    if (pos - start == 4) return std::stoi(value.substr(start, 4));
  }
  return std::nullopt;
}

std::vector<QualityFlag> QualityAuditor::audit(const AggregatedRecord& record,
                                               const std::vector<SpecimenIdentity>& catalogHolders) const {
  std::vector<QualityFlag> out;
  if (cfg_.check_duplicate_catalog) checkDuplicate(record, catalogHolders, out);
  if (cfg_.check_core_fields)       checkCoreFields(record, out);
  if (cfg_.check_dates)             checkDates(record, out);
  if (cfg_.check_catalog_format)    checkCatalogFormat(record, out);
  if (cfg_.check_unmapped_fields)   checkUnmapped(record, out);
  return out;
}

void QualityAuditor::checkDuplicate(const AggregatedRecord& r,
                                    const std::vector<SpecimenIdentity>& holders,
                                    std::vector<QualityFlag>& out) const {
  auto catalog = r.catalogNumber();
  if (!catalog) return;
  std::set<SpecimenIdentity> others(holders.begin(), holders.end());
  others.erase(r.specimen);
  if (others.empty()) return;

  std::string detail = "catalogNumber '" + clip(*catalog) + "' also held by";
  for (const auto& id : others) detail += " " + id;
  out.push_back(makeFlag(r, flag_kind::DuplicateCatalogNumber, Severity::High,
                         "catalogNumber", std::move(detail)));
}

void QualityAuditor::checkCoreFields(const AggregatedRecord& r, std::vector<QualityFlag>& out) const {
  for (const auto& name : cfg_.core_fields) {
    if (valueOf(r, name)) continue;
    out.push_back(makeFlag(r, flag_kind::MissingCoreField, Severity::High, name,
                           name + " is missing"));
  }
}

void QualityAuditor::checkDates(const AggregatedRecord& r, std::vector<QualityFlag>& out) const {
  const int hi = maxYear();
  for (const auto& name : cfg_.date_fields) {
    auto v = valueOf(r, name);
    if (!v) continue;
    if (v->size() > kMaxAuditedLength) {
      out.push_back(makeFlag(r, flag_kind::ImplausibleDate, Severity::Medium, name,
                             name + " is " + std::to_string(v->size()) + " characters long"));
      continue;
    }
    auto y = parseYear(*v);
    if (!y) {
      out.push_back(makeFlag(r, flag_kind::ImplausibleDate, Severity::Medium, name,
                             name + " '" + *v + "' is not a readable date"));
    } else if (*y < cfg_.min_year || *y > hi) {
      out.push_back(makeFlag(r, flag_kind::ImplausibleDate, Severity::Medium, name,
                             name + " year " + std::to_string(*y) + " outside " +
                             std::to_string(cfg_.min_year) + ".." + std::to_string(hi)));
    }
  }
}

void QualityAuditor::checkCatalogFormat(const AggregatedRecord& r, std::vector<QualityFlag>& out) const {
  if (!catalogRe_) return;
  auto catalog = r.catalogNumber();
  if (!catalog) return;
  const std::string value = trimCopy(*catalog);
  if (value.size() <= kMaxAuditedLength && std::regex_match(value, *catalogRe_)) return;
  out.push_back(makeFlag(r, flag_kind::MalformedCatalogNumber, Severity::Medium, "catalogNumber",
                         "catalogNumber '" + clip(*catalog) + "' does not match " + cfg_.catalog_pattern));
}

void QualityAuditor::checkUnmapped(const AggregatedRecord& r, std::vector<QualityFlag>& out) const {
  for (const auto& [name, sel] : r.extra) {
    if (extraTerms_.count(name)) continue;
    out.push_back(makeFlag(r, flag_kind::UnmappedField, Severity::Low, name,
                           "provider key '" + name + "' is not a registered term"));
  }
}

} // namespace hbl
