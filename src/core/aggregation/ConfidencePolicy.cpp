#include "core/aggregation/ConfidencePolicy.hpp"

#include <algorithm>
#include <functional>

#include "core/errors/Errors.hpp"

namespace hbl {

double NoisyOrPolicy::combine(const std::vector<double>& confidences) const {
  if (confidences.empty()) return 0.0;
  if (confidences.size() == 1) return confidences.front();
  // Fixed multiplication order keeps the result bit-identical across runs.
  std::vector<double> sorted(confidences);
  std::sort(sorted.begin(), sorted.end(), std::greater<double>());
  double miss = 1.0;
  for (double c : sorted) miss *= (1.0 - std::clamp(c, 0.0, 1.0));
  return std::min(1.0, 1.0 - miss);
}

double MaxConfidencePolicy::combine(const std::vector<double>& confidences) const {
  if (confidences.empty()) return 0.0;
  return *std::max_element(confidences.begin(), confidences.end());
}

std::unique_ptr<ConfidencePolicy> makeConfidencePolicy(const std::string& name) {
  if (name == "noisy_or") return std::make_unique<NoisyOrPolicy>();
  if (name == "max") return std::make_unique<MaxConfidencePolicy>();
  throw ConfigurationError("unknown confidence policy: " + name);
}

} // namespace hbl
