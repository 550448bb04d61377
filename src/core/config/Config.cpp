#include "core/config/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <regex>

#include "core/errors/Errors.hpp"

using nlohmann::json;

namespace hbl {

namespace {

template <typename T>
void take(const json& j, const char* key, T& out) {
  if (!j.contains(key)) return;
  try {
    out = j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw ConfigurationError(std::string("config key '") + key + "': " + e.what());
  }
}

json section(const json& j, const char* key) {
  if (!j.contains(key)) return json::object();
  if (!j.at(key).is_object()) {
    throw ConfigurationError(std::string("config section '") + key + "' must be an object");
  }
  return j.at(key);
}

void validate(const AppConfig& cfg) {
  const auto& p = cfg.aggregation.confidence_policy;
  if (p != "noisy_or" && p != "max") {
    throw ConfigurationError("unknown confidence_policy: " + p);
  }
  if (cfg.server.port <= 0 || cfg.server.port > 65535) {
    throw ConfigurationError("port out of range: " + std::to_string(cfg.server.port));
  }
  if (cfg.audit.max_year != 0 && cfg.audit.max_year < cfg.audit.min_year) {
    throw ConfigurationError("audit max_year is before min_year");
  }
  if (!cfg.audit.catalog_pattern.empty()) {
    try {
      std::regex re(cfg.audit.catalog_pattern);
    } catch (const std::regex_error& e) {
      throw ConfigurationError("invalid catalog_pattern: " + std::string(e.what()));
    }
  }
}

} // namespace

std::string getEnvOr(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

void applyConfigJson(AppConfig& cfg, const json& j) {
  if (!j.is_object()) throw ConfigurationError("config root must be a JSON object");

  const json server = section(j, "server");
  take(server, "db_path", cfg.server.db_path);
  take(server, "schema_path", cfg.server.schema_path);
  take(server, "image_root", cfg.server.image_root);
  take(server, "port", cfg.server.port);
  take(server, "api_key", cfg.server.api_key);
  take(server, "log_level", cfg.server.log_level);

  const json agg = section(j, "aggregation");
  take(agg, "provider_precedence", cfg.aggregation.provider_precedence);
  take(agg, "confidence_policy", cfg.aggregation.confidence_policy);

  const json audit = section(j, "audit");
  take(audit, "check_duplicate_catalog", cfg.audit.check_duplicate_catalog);
  take(audit, "check_core_fields", cfg.audit.check_core_fields);
  take(audit, "check_dates", cfg.audit.check_dates);
  take(audit, "check_catalog_format", cfg.audit.check_catalog_format);
  take(audit, "check_unmapped_fields", cfg.audit.check_unmapped_fields);
  take(audit, "core_fields", cfg.audit.core_fields);
  take(audit, "date_fields", cfg.audit.date_fields);
  take(audit, "min_year", cfg.audit.min_year);
  take(audit, "max_year", cfg.audit.max_year);
  take(audit, "catalog_pattern", cfg.audit.catalog_pattern);
  take(audit, "extra_terms", cfg.audit.extra_terms);

  validate(cfg);
}

AppConfig loadConfig(const std::string& path) {
  AppConfig cfg;
  if (!path.empty()) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("cannot open config file: " + path);
    json j;
    try {
      j = json::parse(in);
    } catch (const json::parse_error& e) {
      throw ConfigurationError("config file " + path + ": " + e.what());
    }
    applyConfigJson(cfg, j);
  }

  cfg.server.db_path     = getEnvOr("HBL_DB_PATH", cfg.server.db_path);
  cfg.server.schema_path = getEnvOr("HBL_SCHEMA_PATH", cfg.server.schema_path);
  cfg.server.image_root  = getEnvOr("HBL_IMAGE_ROOT", cfg.server.image_root);
  cfg.server.api_key     = getEnvOr("HBL_API_KEY", cfg.server.api_key);
  cfg.server.log_level   = getEnvOr("HBL_LOG_LEVEL", cfg.server.log_level);
  const std::string port = getEnvOr("HBL_PORT", "");
  if (!port.empty()) {
    try {
      cfg.server.port = std::stoi(port);
    } catch (const std::exception&) {
      throw ConfigurationError("HBL_PORT is not a number: " + port);
    }
  }
  validate(cfg);
  return cfg;
}

AppConfig loadConfig() {
  return loadConfig(getEnvOr("HBL_CONFIG", ""));
}

} // namespace hbl
