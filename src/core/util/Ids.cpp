#include "core/util/Ids.hpp"

#include <chrono>
#include <random>
#include <stdexcept>

#include "core/errors/Errors.hpp"

namespace hbl {

std::string uuid4() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto rnd64 = [&]() { return static_cast<uint64_t>(rng()); };
  auto hexn = [](uint64_t v, int n) {
    static const char* k = "0123456789abcdef";
    std::string s(n, '0');
    for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
    return s;
  };
  uint64_t a = rnd64(), b = rnd64();
  // version 4
  a = (a & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  // variant 10xx
  b = (b & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  return hexn(a >> 32, 8) + "-" + hexn((a >> 16) & 0xffffULL, 4) + "-" +
         hexn(a & 0xffffULL, 4) + "-" + hexn(b >> 48, 4) + "-" +
         hexn(b & 0xffffffffffffULL, 12);
}

int64_t nowMillis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

int64_t parseRowId(const std::string& text) {
  size_t used = 0;
  long long v = 0;
  try {
    v = std::stoll(text, &used);
  } catch (const std::invalid_argument&) {
    throw ConfigurationError("not an id: " + text);
  } catch (const std::out_of_range&) {
    throw ConfigurationError("id out of range: " + text);
  }
  if (used != text.size() || v <= 0) throw ConfigurationError("not an id: " + text);
  return static_cast<int64_t>(v);
}

} // namespace hbl
