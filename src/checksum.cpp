#include "checksum.hpp"

std::string to_hex64(uint64_t v) {
  static const char digits[] = "0123456789abcdef";
  std::string s(16, '0');
  for (int i = 15; i >= 0; --i) { s[static_cast<size_t>(i)] = digits[v & 0xf]; v >>= 4; }
  return s;
}

std::string Fnv1a::hex() const { return to_hex64(hash_); }

uint64_t fnv1a64(std::string_view data) {
  Fnv1a h;
  h.update(data);
  return h.value();
}

std::string compute_checksum(std::string_view data) { return to_hex64(fnv1a64(data)); }
