#pragma once
#include <memory>
#include <string>
#include <vector>

#include "core/aggregation/ConfidencePolicy.hpp"
#include "core/config/Config.hpp"
#include "core/model/Types.hpp"

namespace hbl {

struct AggregationResult {
  AggregatedRecord         record;
  std::vector<QualityFlag> flags;  // field_conflict flags
};

// Fuses every completed attempt of a specimen into one record.
//
// Stateless: the result depends only on the attempt set and the config, so
// recomputing after any change (or after a crash) is always safe. Pending
// and failed attempts contribute nothing, whatever their payload holds.
class CandidateAggregator {
public:
  explicit CandidateAggregator(AggregationConfig cfg);
  CandidateAggregator(AggregationConfig cfg, std::shared_ptr<const ConfidencePolicy> policy);

  AggregationResult aggregate(const SpecimenIdentity& specimen,
                              const std::vector<ExtractionAttempt>& attempts) const;

  const ConfidencePolicy& policy() const { return *policy_; }

private:
  // Ranking for "best" candidate: confidence, provider precedence, newest,
  // then attempt id so the order is total.
  bool ranksBefore(const Candidate& a, const Candidate& b) const;
  size_t precedence(const std::string& provider) const;
  SelectedField resolve(const std::string& field, std::vector<Candidate> candidates,
                        AggregationResult& out) const;

  AggregationConfig                       cfg_;
  std::shared_ptr<const ConfidencePolicy> policy_;
};

} // namespace hbl
