// src/core/metadata/InitDb.cpp
#include "core/metadata/InitDb.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/errors/Errors.hpp"

namespace hbl {

static constexpr int kSchemaVersion = 2;

static void execAll(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StorageError("SQLite exec failed: " + msg);
    }
}

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(
        dbPath.c_str(),
        &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw StorageError("Failed to open DB: " + msg);
    }

    try {
        // Pragmas: concurrency + durability + integrity
        execAll(db, "PRAGMA journal_mode=WAL;");
        execAll(db, "PRAGMA synchronous=NORMAL;");
        execAll(db, "PRAGMA foreign_keys=ON;");
        execAll(db, "PRAGMA busy_timeout=5000;");

        std::ifstream in(schemaPath);
        if (!in) throw ConfigurationError("Cannot open schema file: " + schemaPath);
        std::ostringstream buf; buf << in.rdbuf();
        execAll(db, "BEGIN IMMEDIATE;");
        try {
            execAll(db, buf.str());
            execAll(db, "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
            execAll(db, "COMMIT;");
        } catch (...) {
            sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
            throw;
        }

        sqlite3_close(db);
        spdlog::debug("schema v{} applied to {}", kSchemaVersion, dbPath);
        return true;
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
}

std::string findSchemaPath(const std::string& preferred) {
    namespace fs = std::filesystem;
    if (!preferred.empty()) {
        if (fs::exists(preferred)) return preferred;
        throw ConfigurationError("schema file not found: " + preferred);
    }
    const fs::path candidates[] = {
        fs::current_path() / "schema.sql",
        fs::path("src/core/metadata/schema.sql")
    };
    for (const auto& p : candidates) {
        if (fs::exists(p)) return p.string();
    }
    throw ConfigurationError("schema.sql not found (looked in working directory and src/core/metadata)");
}

} // namespace hbl
