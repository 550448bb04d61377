#include "core/addressing/ContentAddressor.hpp"

#include <openssl/evp.h>

#include <array>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <memory>

#include "core/errors/Errors.hpp"

using nlohmann::json;

namespace hbl {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string toHex(const uint8_t* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

MdCtx newSha256() {
  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx) throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("OpenSSL: EVP_DigestInit_ex failed");
  }
  return ctx;
}

std::string finishHex(EVP_MD_CTX* ctx) {
  std::array<uint8_t, EVP_MAX_MD_SIZE> out{};
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx, out.data(), &out_len) != 1) {
    throw std::runtime_error("OpenSSL: EVP_DigestFinal_ex failed");
  }
  if (out_len != 32) throw std::runtime_error("OpenSSL: unexpected SHA-256 digest length");
  return toHex(out.data(), out_len);
}

void requireCanonical(const json& v, const std::string& path) {
  switch (v.type()) {
    case json::value_t::object:
      for (const auto& [k, child] : v.items()) requireCanonical(child, path + "." + k);
      break;
    case json::value_t::array:
      for (size_t i = 0; i < v.size(); ++i) {
        requireCanonical(v[i], path + "[" + std::to_string(i) + "]");
      }
      break;
    case json::value_t::number_float:
      if (!std::isfinite(v.get<double>())) {
        throw ConfigurationError("parameter " + path + " is not a finite number");
      }
      break;
    case json::value_t::binary:
    case json::value_t::discarded:
      throw ConfigurationError("parameter " + path + " has no canonical JSON form");
    default:
      break;
  }
}

} // namespace

std::string sha256Hex(std::string_view bytes) {
  MdCtx ctx = newSha256();
  if (!bytes.empty() && EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1) {
    throw std::runtime_error("OpenSSL: EVP_DigestUpdate failed");
  }
  return finishHex(ctx.get());
}

SpecimenIdentity hashImage(std::string_view bytes) {
  return sha256Hex(bytes);
}

SpecimenIdentity hashFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw ConfigurationError("cannot open image: " + path);
  MdCtx ctx = newSha256();
  std::array<char, 64 * 1024> buf{};
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    std::streamsize n = in.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
      throw std::runtime_error("OpenSSL: EVP_DigestUpdate failed");
    }
  }
  if (in.bad()) throw ConfigurationError("read error on image: " + path);
  return finishHex(ctx.get());
}

std::string canonicalParams(const json& params) {
  if (!params.is_object()) throw ConfigurationError("extraction parameters must be a JSON object");
  requireCanonical(params, "params");
  // nlohmann::json objects are std::map backed, so dump() already emits
  // keys in sorted order at every depth.
  try {
    return params.dump();
  } catch (const json::type_error& e) {
    throw ConfigurationError(std::string("parameters not representable: ") + e.what());
  }
}

ParamsHash hashParams(const json& params) {
  return sha256Hex(canonicalParams(params));
}

} // namespace hbl
