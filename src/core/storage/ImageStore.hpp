#pragma once
#include <string>
#include <string_view>
#include <utility>

#include "core/model/Types.hpp"

namespace hbl {

// Content-addressed image blobs on the local filesystem:
// <root>/<first two hex chars>/<identity>.
class ImageStore {
public:
  explicit ImageStore(std::string root) : root_(std::move(root)) {}

  // Writes bytes under their identity unless already present; returns the
  // full path. Throws StorageError if the write fails.
  std::string put(const SpecimenIdentity& identity, std::string_view bytes);
  // Same, copying from a file already hashed to identity.
  std::string putFile(const SpecimenIdentity& identity, const std::string& source);

  std::string pathFor(const SpecimenIdentity& identity) const;
  bool contains(const SpecimenIdentity& identity) const;

private:
  std::string root_;
};

} // namespace hbl
