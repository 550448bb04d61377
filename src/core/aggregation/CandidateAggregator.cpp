#include "core/aggregation/CandidateAggregator.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace hbl {

CandidateAggregator::CandidateAggregator(AggregationConfig cfg)
  : cfg_(std::move(cfg)), policy_(makeConfidencePolicy(cfg_.confidence_policy)) {}

CandidateAggregator::CandidateAggregator(AggregationConfig cfg,
                                         std::shared_ptr<const ConfidencePolicy> policy)
  : cfg_(std::move(cfg)), policy_(std::move(policy)) {}

size_t CandidateAggregator::precedence(const std::string& provider) const {
  const auto& order = cfg_.provider_precedence;
  auto it = std::find(order.begin(), order.end(), provider);
  return static_cast<size_t>(it - order.begin());
}

bool CandidateAggregator::ranksBefore(const Candidate& a, const Candidate& b) const {
  if (a.confidence != b.confidence) return a.confidence > b.confidence;
  const size_t pa = precedence(a.provider), pb = precedence(b.provider);
  if (pa != pb) return pa < pb;
  if (a.created_at != b.created_at) return a.created_at > b.created_at;
  return a.attempt_id < b.attempt_id;
}

SelectedField CandidateAggregator::resolve(const std::string& field,
                                           std::vector<Candidate> candidates,
                                           AggregationResult& out) const {
  std::sort(candidates.begin(), candidates.end(),
            [this](const Candidate& a, const Candidate& b) { return ranksBefore(a, b); });

  const Candidate& best = candidates.front();
  const std::string key = normalizeValue(best.value);

  std::vector<double> agreeing;
  std::set<std::string> distinct;
  for (const auto& c : candidates) {
    const std::string k = normalizeValue(c.value);
    distinct.insert(k);
    if (k == key) agreeing.push_back(c.confidence);
  }

  SelectedField sel;
  sel.value      = best.value;
  sel.attempt_id = best.attempt_id;
  sel.provider   = best.provider;
  sel.support    = agreeing.size();
  sel.confidence = std::min(1.0, policy_->combine(agreeing));

  if (distinct.size() > 1) {
    out.record.conflicts[field] = candidates;
    QualityFlag flag;
    flag.specimen = out.record.specimen;
    flag.kind     = flag_kind::FieldConflict;
    flag.severity = Severity::Medium;
    flag.field    = field;
    flag.detail   = std::to_string(distinct.size()) + " distinct values across " +
                    std::to_string(candidates.size()) + " attempts; provisional '" +
                    best.value + "' from attempt " + best.attempt_id;
    out.flags.push_back(std::move(flag));
  }
  return sel;
}

AggregationResult CandidateAggregator::aggregate(const SpecimenIdentity& specimen,
                                                 const std::vector<ExtractionAttempt>& attempts) const {
  AggregationResult out;
  out.record.specimen = specimen;

  std::map<DwcField, std::vector<Candidate>>    known;
  std::map<std::string, std::vector<Candidate>> extra;

  auto collect = [](const ExtractionAttempt& a, const FieldValue& v) {
    return Candidate{v.value, v.confidence, a.id, a.provider, a.created_at};
  };

  for (const auto& a : attempts) {
    if (a.status != AttemptStatus::Complete || a.specimen != specimen) continue;
    ++out.record.attempt_count;
    for (const auto& [f, v] : a.fields.known) {
      if (trimCopy(v.value).empty()) continue;
      known[f].push_back(collect(a, v));
    }
    for (const auto& [name, v] : a.fields.extra) {
      if (trimCopy(v.value).empty()) continue;
      extra[name].push_back(collect(a, v));
    }
  }

  double sum = 0.0;
  for (auto& [f, cands] : known) {
    out.record.fields[f] = resolve(fieldName(f), std::move(cands), out);
    sum += out.record.fields[f].confidence;
  }
  for (auto& [name, cands] : extra) {
    out.record.extra[name] = resolve(name, std::move(cands), out);
    sum += out.record.extra[name].confidence;
  }

  const size_t n = out.record.fields.size() + out.record.extra.size();
  out.record.confidence = n ? sum / static_cast<double>(n) : 0.0;
  return out;
}

} // namespace hbl
