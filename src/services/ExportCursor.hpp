#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <string>

#include "core/metadata/SpecimenIndex.hpp"
#include "core/provenance/ProvenanceTracker.hpp"

namespace hbl {

// Lazy sequence of (record, lineage) for the specimens matching a filter,
// in identity order. Pages are fetched on demand. To resume after a crash,
// build a new cursor with filter.after = resumeToken().
class ExportCursor {
public:
  ExportCursor(SpecimenIndex& index, ProvenanceTracker& tracker, SpecimenFilter filter);

  std::optional<LineageChain> next();

  // Identity of the last chain returned, or the starting cursor.
  const std::string& resumeToken() const { return token_; }
  size_t delivered() const { return delivered_; }

private:
  bool fill();

  SpecimenIndex&           index_;
  ProvenanceTracker&       tracker_;
  SpecimenFilter           filter_;
  std::deque<SpecimenIdentity> pending_;
  std::string              token_;
  bool                     exhausted_ = false;
  size_t                   delivered_ = 0;
};

} // namespace hbl
