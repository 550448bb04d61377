#pragma once
#include <string>

namespace hbl {

// Creates the database file if needed, sets WAL/busy-timeout pragmas and
// applies schema.sql. Idempotent. Throws StorageError on failure.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

// Looks for schema.sql next to the working directory first, then in the
// source tree. Throws ConfigurationError if neither exists.
std::string findSchemaPath(const std::string& preferred = {});

} // namespace hbl
