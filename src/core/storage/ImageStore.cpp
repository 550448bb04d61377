#include "core/storage/ImageStore.hpp"

#include <filesystem>
#include <fstream>

#include "core/errors/Errors.hpp"

namespace hbl {

std::string ImageStore::pathFor(const SpecimenIdentity& identity) const {
  namespace fs = std::filesystem;
  const std::string shard = identity.size() >= 2 ? identity.substr(0, 2) : std::string("__");
  return (fs::path(root_) / shard / identity).string();
}

bool ImageStore::contains(const SpecimenIdentity& identity) const {
  return std::filesystem::exists(pathFor(identity));
}

namespace {

// Moves a finished ".part" file into place so a concurrent reader never
// sees half a blob.
std::string publish(const std::filesystem::path& tmp, const std::filesystem::path& file) {
  std::error_code ec;
  std::filesystem::rename(tmp, file, ec);
  if (ec) throw StorageError("failed to store image " + file.string() + ": " + ec.message());
  return std::filesystem::weakly_canonical(file).string();
}

} // namespace

std::string ImageStore::put(const SpecimenIdentity& identity, std::string_view bytes) {
  namespace fs = std::filesystem;
  fs::path file = pathFor(identity);
  if (contains(identity)) return fs::weakly_canonical(file).string();

  fs::create_directories(file.parent_path());
  fs::path tmp = file;
  tmp += ".part";
  {
    std::ofstream os(tmp, std::ios::binary);
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) throw StorageError("failed to write image " + tmp.string());
  }
  return publish(tmp, file);
}

std::string ImageStore::putFile(const SpecimenIdentity& identity, const std::string& source) {
  namespace fs = std::filesystem;
  fs::path file = pathFor(identity);
  if (contains(identity)) return fs::weakly_canonical(file).string();

  fs::create_directories(file.parent_path());
  fs::path tmp = file;
  tmp += ".part";
  std::error_code ec;
  fs::copy_file(source, tmp, fs::copy_options::overwrite_existing, ec);
  if (ec) throw StorageError("failed to copy image " + source + ": " + ec.message());
  return publish(tmp, file);
}

} // namespace hbl
