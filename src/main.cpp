// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "core/config/Config.hpp"
#include "core/errors/Errors.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/SqliteSpecimenIndex.hpp"
#include "core/model/Json.hpp"
#include "core/storage/ImageStore.hpp"
#include "services/SpecimenService.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

static void ensure_dirs_for(const std::string& file_path) {
  namespace fs = std::filesystem;
  fs::path parent = fs::path(file_path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
}

// Self-heal DB on startup (idempotent)
static void open_db(const hbl::AppConfig& cfg) {
  const std::string schemaPath = hbl::findSchemaPath(cfg.server.schema_path);
  ensure_dirs_for(cfg.server.db_path);
  hbl::initDatabase(cfg.server.db_path, schemaPath);
}

static bool looks_like_identity(const std::string& s) {
  if (s.size() != 64) return false;
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init                 # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve                # start HTTP server (HBL_PORT or 8080)\n"
            << "  " << argv0 << " --audit                # recompute every record and its flags\n"
            << "  " << argv0 << " --export [review]      # JSON lines of lineage chains to stdout\n"
            << "  " << argv0 << " --lineage <id|catalog> # lineage of a specimen or catalog number\n"
            << "  " << argv0 << " --stats                # index counters\n"
            << "Config: HBL_CONFIG=<file.json>, HBL_DB_PATH, HBL_IMAGE_ROOT, HBL_PORT, HBL_API_KEY, HBL_LOG_LEVEL\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      print_usage(argv[0]);
      return 1;
    }
    const std::string mode = argv[1];

    const hbl::AppConfig cfg = hbl::loadConfig();
    // stdout carries data for --export/--lineage/--stats
    spdlog::set_default_logger(spdlog::stderr_color_mt("hbl"));
    spdlog::set_level(spdlog::level::from_str(cfg.server.log_level));

    if (mode == "--init") {
      open_db(cfg);
      std::cout << "DB initialized at: " << cfg.server.db_path << "\n";
      return 0;
    }

    if (mode == "--serve") {
      open_db(cfg);
      std::filesystem::create_directories(cfg.server.image_root);

      // Construct services
      hbl::SqliteSpecimenIndex index(cfg.server.db_path);
      hbl::ImageStore images(cfg.server.image_root);
      hbl::SpecimenService service(index, cfg, &images);

      if (cfg.server.api_key.empty()) spdlog::warn("HBL_API_KEY not set: authentication disabled");
      hbl::run_http_server(service, cfg.server.port, cfg.server.api_key);
      return 0;
    }

    if (mode == "--audit" || mode == "--export" || mode == "--lineage" || mode == "--stats") {
      open_db(cfg);
      hbl::SqliteSpecimenIndex index(cfg.server.db_path);
      hbl::SpecimenService service(index, cfg);

      if (mode == "--audit") {
        const size_t n = service.recomputeAll();
        const auto dups = index.listDuplicates();
        std::cout << "audited " << n << " specimens\n";
        for (const auto& [catalog, holders] : dups) {
          std::cout << "duplicate catalogNumber '" << catalog << "':";
          for (const auto& h : holders) std::cout << " " << h;
          std::cout << "\n";
        }
        return 0;
      }

      if (mode == "--export") {
        hbl::SpecimenFilter filter;
        filter.limit = 200;
        if (argc > 2) filter.review_status = argv[2];
        auto cursor = service.exportRecords(filter);
        while (auto chain = cursor.next()) {
          std::cout << hbl::toJson(*chain).dump() << "\n";
        }
        spdlog::info("exported {} chains", cursor.delivered());
        return 0;
      }

      if (mode == "--lineage") {
        if (argc < 3) {
          print_usage(argv[0]);
          return 1;
        }
        const std::string key = argv[2];
        if (looks_like_identity(key)) {
          auto chain = service.lineage(key);
          if (!chain) {
            std::cerr << "unknown specimen: " << key << "\n";
            return 1;
          }
          std::cout << hbl::toJson(*chain).dump(2) << "\n";
          return 0;
        }
        nlohmann::json chains = nlohmann::json::array();
        for (const auto& c : service.lineageByCatalogNumber(key)) chains.push_back(hbl::toJson(c));
        std::cout << chains.dump(2) << "\n";
        return chains.empty() ? 1 : 0;
      }

      std::cout << hbl::toJson(service.stats()).dump(2) << "\n";
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const hbl::ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
