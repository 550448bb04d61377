#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "core/model/Types.hpp"

namespace hbl {

// Reference to the image handed to a provider: its identity plus wherever
// the caller keeps the bytes.
struct ImageRef {
  SpecimenIdentity identity;
  std::string      location;
};

// One external text/field-extraction provider. Implementations live
// outside this library. extract() throws TransientEngineError for
// timeouts, rate limits and outages, and ConfigurationError for missing
// credentials or unusable parameters. Anything it throws becomes a failed
// attempt; nothing here retries.
class ExtractionEngine {
public:
  virtual ~ExtractionEngine() = default;
  virtual std::string name() const = 0;
  virtual EngineResult extract(const ImageRef& image, const nlohmann::json& params) = 0;
};

} // namespace hbl
