#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace basil {

// Stable 64-bit FNV-1a. Not cryptographic; used for content identity of
// campaign definitions across processes.
class Fnv1a64 {
public:
  static const uint64_t kOffsetBasis = 14695981039346656037ull;
  static const uint64_t kPrime = 1099511628211ull;

  Fnv1a64() : _h(kOffsetBasis) {}

  void update(const void *data, size_t n);
  void update(const std::string &s) { update(s.data(), s.size()); }

  uint64_t value() const { return _h; }

  // Lower-case, zero-padded, 16 characters.
  std::string hex() const;

private:
  uint64_t _h;
};

std::string fnv1a_hex(const std::string &data);

} // namespace basil
