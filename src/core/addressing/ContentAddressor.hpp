#pragma once
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/model/Types.hpp"

namespace hbl {

// Lowercase hex SHA-256 of arbitrary bytes.
std::string sha256Hex(std::string_view bytes);

// Identity of an image: SHA-256 of its raw bytes. Filenames never matter.
SpecimenIdentity hashImage(std::string_view bytes);

// Streams a file through the digest. Throws ConfigurationError if the file
// cannot be read.
SpecimenIdentity hashFile(const std::string& path);

// Compact JSON with object keys sorted at every depth; arrays keep their
// order. Throws ConfigurationError for values with no canonical form
// (non-finite numbers, binary blobs, invalid UTF-8, non-object root).
std::string canonicalParams(const nlohmann::json& params);

// SHA-256 of canonicalParams(params).
ParamsHash hashParams(const nlohmann::json& params);

} // namespace hbl
