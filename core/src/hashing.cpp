#include <public/hashing.hpp>

#include <cstdio>

namespace basil {

const uint64_t Fnv1a64::kOffsetBasis;
const uint64_t Fnv1a64::kPrime;

void Fnv1a64::update(const void *data, size_t n) {
  const unsigned char *p = static_cast<const unsigned char *>(data);
  for (size_t i = 0; i < n; ++i) {
    _h ^= static_cast<uint64_t>(p[i]);
    _h *= kPrime;
  }
}

std::string Fnv1a64::hex() const {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx",
                static_cast<unsigned long long>(_h));
  return std::string(buf);
}

std::string fnv1a_hex(const std::string &data) {
  Fnv1a64 h;
  h.update(data);
  return h.hex();
}

} // namespace basil
