#pragma once
#include <stdexcept>
#include <string>

namespace hbl {

// Invalid or unhashable parameters, missing credentials, bad config.
// Fatal to the single attempt or startup step that raised it.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Timeouts, rate limiting, provider outage. Recorded as a failed attempt;
// retrying is the orchestrator's call.
class TransientEngineError : public std::runtime_error {
public:
  explicit TransientEngineError(const std::string& what) : std::runtime_error(what) {}
};

// Rejected at the storage boundary: mutating a terminal attempt or losing a
// duplicate-registration race. Callers treat it as "already handled".
class IntegrityViolation : public std::runtime_error {
public:
  explicit IntegrityViolation(const std::string& what) : std::runtime_error(what) {}
};

// Any other SQLite failure.
class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace hbl
