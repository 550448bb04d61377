#include "services/ExportCursor.hpp"

#include <utility>

namespace hbl {

ExportCursor::ExportCursor(SpecimenIndex& index, ProvenanceTracker& tracker, SpecimenFilter filter)
  : index_(index), tracker_(tracker), filter_(std::move(filter)), token_(filter_.after) {}

bool ExportCursor::fill() {
  if (exhausted_) return false;
  SpecimenPage page = index_.listSpecimens(filter_);
  for (auto& s : page.items) pending_.push_back(std::move(s.identity));
  if (page.next_cursor.empty()) {
    exhausted_ = true;
  } else {
    filter_.after = page.next_cursor;
  }
  return !pending_.empty();
}

std::optional<LineageChain> ExportCursor::next() {
  for (;;) {
    if (pending_.empty() && !fill()) return std::nullopt;
    SpecimenIdentity id = std::move(pending_.front());
    pending_.pop_front();
    token_ = id;
    if (auto chain = tracker_.lineage(id)) {
      ++delivered_;
      return chain;
    }
  }
}

} // namespace hbl
