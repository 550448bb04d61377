#pragma once
#include <memory>
#include <string>
#include <vector>

namespace hbl {

// How the confidences of attempts that agree on one value combine into the
// field's confidence. Policy, not law: swap it through AggregationConfig.
class ConfidencePolicy {
public:
  virtual ~ConfidencePolicy() = default;
  virtual const char* name() const = 0;
  // confidences is non-empty, each in [0,1]. Result is in [0,1].
  virtual double combine(const std::vector<double>& confidences) const = 0;
};

// 1 - prod(1 - c_i): independent agreeing evidence raises confidence.
class NoisyOrPolicy : public ConfidencePolicy {
public:
  const char* name() const override { return "noisy_or"; }
  double combine(const std::vector<double>& confidences) const override;
};

// Agreement adds nothing; the best single attempt stands.
class MaxConfidencePolicy : public ConfidencePolicy {
public:
  const char* name() const override { return "max"; }
  double combine(const std::vector<double>& confidences) const override;
};

// Throws ConfigurationError for an unknown name.
std::unique_ptr<ConfidencePolicy> makeConfidencePolicy(const std::string& name);

} // namespace hbl
