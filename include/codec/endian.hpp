// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <bit>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string_view>

namespace shapefuzz {
namespace codec {

/**
 * Byte order applied to every multi-byte numeric write of one encode call
 */
enum class Endianness : uint8_t {
  Little,
  Big,
};

inline const char *EndiannessName(Endianness e) {
  return e == Endianness::Big ? "big" : "little";
}

// Accepts "little"/"le" and "big"/"be"
inline std::optional<Endianness> ParseEndianness(std::string_view name) {
  if (name == "little" || name == "le") {
    return Endianness::Little;
  }
  if (name == "big" || name == "be") {
    return Endianness::Big;
  }
  return std::nullopt;
}

// Byteswap functions (C++23 has std::byteswap)
inline uint16_t byteswap16(uint16_t x) { return static_cast<uint16_t>((x >> 8) | (x << 8)); }

inline uint32_t byteswap32(uint32_t x) {
  return ((x >> 24) & 0x000000FF) | ((x >> 8) & 0x0000FF00) |
         ((x << 8) & 0x00FF0000) | ((x << 24) & 0xFF000000);
}

inline uint64_t byteswap64(uint64_t x) {
  return ((x >> 56) & 0x00000000000000FFULL) |
         ((x >> 40) & 0x000000000000FF00ULL) |
         ((x >> 24) & 0x0000000000FF0000ULL) |
         ((x >> 8) & 0x00000000FF000000ULL) |
         ((x << 8) & 0x000000FF00000000ULL) |
         ((x << 24) & 0x0000FF0000000000ULL) |
         ((x << 40) & 0x00FF000000000000ULL) |
         ((x << 56) & 0xFF00000000000000ULL);
}

inline bool NeedsSwap(Endianness order) {
  if constexpr (std::endian::native == std::endian::little) {
    return order == Endianness::Big;
  } else {
    return order == Endianness::Little;
  }
}

inline void Write16(uint8_t *ptr, uint16_t value, Endianness order) {
  if (NeedsSwap(order)) {
    value = byteswap16(value);
  }
  std::memcpy(ptr, &value, sizeof(value));
}

inline void Write32(uint8_t *ptr, uint32_t value, Endianness order) {
  if (NeedsSwap(order)) {
    value = byteswap32(value);
  }
  std::memcpy(ptr, &value, sizeof(value));
}

inline void Write64(uint8_t *ptr, uint64_t value, Endianness order) {
  if (NeedsSwap(order)) {
    value = byteswap64(value);
  }
  std::memcpy(ptr, &value, sizeof(value));
}

} // namespace codec
} // namespace shapefuzz
