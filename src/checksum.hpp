#pragma once
/*
 * Checksum
 *
 * Purpose: deterministic 64-bit FNV-1a content checksums, rendered as
 *          16 lowercase hex digits. Used for recovery chunks, recovery
 *          metadata, saved-state fingerprints and path-derived buffer ids.
 */
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

#define PE_FNV_OFFSET_BASIS 0xcbf29ce484222325ULL
#define PE_FNV_PRIME 0x100000001b3ULL

/* incremental form, for content that is gathered piece by piece */
class Fnv1a {
public:
  void update(const void* data, size_t len) {
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    for (size_t i = 0; i < len; ++i) {
      hash_ ^= bytes[i];
      hash_ *= PE_FNV_PRIME;
    }
  }
  void update(std::string_view s) { update(s.data(), s.size()); }
  uint64_t value() const { return hash_; }
  std::string hex() const;
private:
  uint64_t hash_ = PE_FNV_OFFSET_BASIS;
};

uint64_t fnv1a64(std::string_view data);
std::string to_hex64(uint64_t v);
std::string compute_checksum(std::string_view data);
