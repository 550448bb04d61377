#pragma once
#include <cstdint>
#include <string>

namespace hbl {

// Random RFC 4122 version-4 identifier.
std::string uuid4();

// Milliseconds since the Unix epoch.
int64_t nowMillis();

// Positive decimal row id; throws ConfigurationError otherwise.
int64_t parseRowId(const std::string& text);

} // namespace hbl
