#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hbl {

struct AggregationConfig {
  // Earlier providers win confidence ties. Unlisted providers rank last.
  std::vector<std::string> provider_precedence;
  // "noisy_or" or "max".
  std::string confidence_policy = "noisy_or";
};

struct AuditConfig {
  bool check_duplicate_catalog = true;
  bool check_core_fields       = true;
  bool check_dates             = true;
  bool check_catalog_format    = true;
  bool check_unmapped_fields   = true;

  std::vector<std::string> core_fields = {"scientificName", "catalogNumber"};
  std::vector<std::string> date_fields = {"eventDate", "dateIdentified"};
  int min_year = 1800;
  int max_year = 0;  // 0 = current year
  // ECMAScript regex matched against the whole value. Empty disables.
  std::string catalog_pattern = R"(^AAFC-\d{5,6}$)";
  // Extra (non Darwin Core) keys accepted without an unmapped_field flag.
  std::vector<std::string> extra_terms;
};

struct ServerConfig {
  std::string db_path     = "data/herbarium-ledger.db";
  std::string schema_path;  // empty = search working directory, then source tree
  std::string image_root  = "data/images";
  int         port        = 8080;
  std::string api_key;      // empty = auth disabled
  std::string log_level   = "info";
};

struct AppConfig {
  ServerConfig      server;
  AggregationConfig aggregation;
  AuditConfig       audit;
};

// Applies the keys present in j on top of cfg. Throws ConfigurationError
// on wrong types or unknown values.
void applyConfigJson(AppConfig& cfg, const nlohmann::json& j);

// Defaults, then the JSON file named by HBL_CONFIG (if set), then the
// HBL_DB_PATH, HBL_SCHEMA_PATH, HBL_IMAGE_ROOT, HBL_PORT, HBL_API_KEY and
// HBL_LOG_LEVEL environment variables.
AppConfig loadConfig();

// Same, but with an explicit config file path (empty = none).
AppConfig loadConfig(const std::string& path);

std::string getEnvOr(const char* key, const std::string& defval);

} // namespace hbl
