// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "codec/byte_sink.hpp"
#include "codec/value_types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace shapefuzz {
namespace codec {

/**
 * Codec<T> - exact serialized size and binary encoding for leaf values
 *
 * Each specialization provides:
 *   static constexpr bool kFixedSize;
 *   static size_t SerializedSize(const T&);
 *   static size_t MinNonzeroElementsSize();
 *   static void Encode(const T&, ByteSink&);
 *
 * Composite values (registered structs, variants) are handled by the
 * fuzz layer, which reuses the sequence helpers below.
 */
template <typename T, typename Enable = void> struct Codec;

// Fixed-width integers (bool has its own specialization)
template <typename T>
struct Codec<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
  static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8,
                "unsupported integer width");

  static constexpr bool kFixedSize = true;

  static size_t SerializedSize(const T &) { return sizeof(T); }
  static size_t MinNonzeroElementsSize() { return sizeof(T); }

  static void Encode(const T &value, ByteSink &sink) {
    using U = std::make_unsigned_t<T>;
    const U bits = static_cast<U>(value);
    if constexpr (sizeof(T) == 1) {
      sink.write_uint8(static_cast<uint8_t>(bits));
    } else if constexpr (sizeof(T) == 2) {
      sink.write_uint16(static_cast<uint16_t>(bits));
    } else if constexpr (sizeof(T) == 4) {
      sink.write_uint32(static_cast<uint32_t>(bits));
    } else {
      sink.write_uint64(static_cast<uint64_t>(bits));
    }
  }
};

// Unit enumerations encode as their underlying integer
template <typename E>
struct Codec<E, std::enable_if_t<std::is_enum_v<E>>> {
  using Underlying = std::underlying_type_t<E>;

  static constexpr bool kFixedSize = true;

  static size_t SerializedSize(const E &) { return sizeof(Underlying); }
  static size_t MinNonzeroElementsSize() { return sizeof(Underlying); }

  static void Encode(const E &value, ByteSink &sink) {
    Codec<Underlying>::Encode(static_cast<Underlying>(value), sink);
  }
};

template <> struct Codec<float> {
  static constexpr bool kFixedSize = true;
  static size_t SerializedSize(const float &) { return sizeof(float); }
  static size_t MinNonzeroElementsSize() { return sizeof(float); }
  static void Encode(const float &value, ByteSink &sink) { sink.write_float(value); }
};

template <> struct Codec<double> {
  static constexpr bool kFixedSize = true;
  static size_t SerializedSize(const double &) { return sizeof(double); }
  static size_t MinNonzeroElementsSize() { return sizeof(double); }
  static void Encode(const double &value, ByteSink &sink) { sink.write_double(value); }
};

// A C++ bool can only hold 0/1; RawBool carries arbitrary backing bytes
template <> struct Codec<bool> {
  static constexpr bool kFixedSize = true;
  static size_t SerializedSize(const bool &) { return 1; }
  static size_t MinNonzeroElementsSize() { return 1; }
  static void Encode(const bool &value, ByteSink &sink) { sink.write_uint8(value ? 1 : 0); }
};

template <> struct Codec<RawBool> {
  static constexpr bool kFixedSize = true;
  static size_t SerializedSize(const RawBool &) { return 1; }
  static size_t MinNonzeroElementsSize() { return 1; }
  static void Encode(const RawBool &value, ByteSink &sink) { sink.write_uint8(value.raw()); }
};

// UTF-8 text: size is the byte length, not the code point count
template <> struct Codec<std::string> {
  static constexpr bool kFixedSize = false;
  static size_t SerializedSize(const std::string &value) { return value.size(); }
  static size_t MinNonzeroElementsSize() { return 1; }
  static void Encode(const std::string &value, ByteSink &sink) {
    sink.write_bytes(reinterpret_cast<const uint8_t *>(value.data()), value.size());
  }
};

template <> struct Codec<AsciiString> {
  static constexpr bool kFixedSize = false;
  static size_t SerializedSize(const AsciiString &value) { return value.value.size(); }
  static size_t MinNonzeroElementsSize() { return 1; }
  static void Encode(const AsciiString &value, ByteSink &sink) {
    Codec<std::string>::Encode(value.value, sink);
  }
};

// ----------------------------------------------------------------------------
// Sequence helpers
// ----------------------------------------------------------------------------

/**
 * Default sequence size: sum of per-element sizes. O(n), since elements
 * are not guaranteed to share a width (e.g. text).
 */
template <typename Range, typename SizeFn>
size_t SequenceSerializedSize(const Range &items, SizeFn &&element_size) {
  size_t total = 0;
  for (const auto &item : items) {
    total += element_size(item);
  }
  return total;
}

template <typename Range, typename EncodeFn>
void EncodeSequence(const Range &items, ByteSink &sink, EncodeFn &&encode_element) {
  for (const auto &item : items) {
    encode_element(item, sink);
  }
}

// Encode a leaf value into a fresh buffer
template <typename T>
std::vector<uint8_t> EncodeToBytes(const T &value, Endianness order) {
  BufferSink sink(order);
  Codec<T>::Encode(value, sink);
  return sink.release();
}

} // namespace codec
} // namespace shapefuzz
