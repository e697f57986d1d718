// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace shapefuzz {

/**
 * Boolean with an explicit backing byte
 *
 * A C++ bool may only hold 0 or 1, but targets under test read a whole
 * byte. RawBool keeps whatever byte a mutation wrote (e.g. 0x07) and the
 * codec emits it verbatim.
 */
class RawBool {
public:
  constexpr RawBool() = default;
  constexpr explicit RawBool(bool value) : raw_(value ? 1 : 0) {}

  static constexpr RawBool FromRaw(uint8_t raw) {
    RawBool b;
    b.raw_ = raw;
    return b;
  }

  constexpr uint8_t raw() const { return raw_; }
  constexpr bool is_canonical() const { return raw_ <= 1; }
  constexpr explicit operator bool() const { return raw_ != 0; }

  friend constexpr bool operator==(const RawBool &a, const RawBool &b) {
    return a.raw_ == b.raw_;
  }

private:
  uint8_t raw_{0};
};

/**
 * Text restricted to 7-bit code points
 */
struct AsciiString {
  std::string value;

  AsciiString() = default;
  explicit AsciiString(std::string s) : value(std::move(s)) {}

  friend bool operator==(const AsciiString &a, const AsciiString &b) {
    return a.value == b.value;
  }
};

} // namespace shapefuzz
