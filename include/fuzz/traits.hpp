// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "codec/byte_sink.hpp"
#include "codec/primitive_codec.hpp"
#include "codec/value_types.hpp"
#include "fuzz/constraints.hpp"
#include "fuzz/mutator.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace shapefuzz {
namespace fuzz {

class ShapeRegistry;

/**
 * FuzzTraits<T> - generation, mutation and serialization for one type
 *
 * Every specialization exposes the same static interface:
 *
 *   using RangeType;   // what Constraints bound: the value for numbers,
 *                      // the element / code point count otherwise
 *   static T NewFuzzed(Mutator&, const Constraints<RangeType>*);
 *   static void Mutate(T&, Mutator&, const Constraints<RangeType>*);
 *   static void Fixup(T&, Mutator&);
 *   static void OnSuccess(const T&, const ShapeRegistry&);
 *   static size_t SerializedSize(const T&, const ShapeRegistry&);
 *   static size_t MinNonzeroElementsSize(const ShapeRegistry&);
 *   static bool IsFixedSize(const ShapeRegistry&);
 *   static void BinarySerialize(const T&, codec::ByteSink&, const ShapeRegistry&);
 *
 * Leaf types are specialized here. Anything else (registered structs,
 * enums and std::variant) falls through to ShapedTraits, which looks the
 * type up in the ShapeRegistry.
 */
template <typename T, typename Enable = void> struct ShapedTraits;

template <typename T, typename Enable = void> struct FuzzTraits : ShapedTraits<T> {};

/**
 * Shared plumbing for types whose size and bytes come from codec::Codec
 */
template <typename T> struct LeafTraits {
  static void Fixup(T &, Mutator &) {}
  static void OnSuccess(const T &, const ShapeRegistry &) {}

  static size_t SerializedSize(const T &value, const ShapeRegistry &) {
    return codec::Codec<T>::SerializedSize(value);
  }

  static size_t MinNonzeroElementsSize(const ShapeRegistry &) {
    return codec::Codec<T>::MinNonzeroElementsSize();
  }

  static bool IsFixedSize(const ShapeRegistry &) { return codec::Codec<T>::kFixedSize; }

  static void BinarySerialize(const T &value, codec::ByteSink &sink, const ShapeRegistry &) {
    codec::Codec<T>::Encode(value, sink);
  }
};

// ----------------------------------------------------------------------------
// Numbers
// ----------------------------------------------------------------------------

template <typename T>
struct FuzzTraits<T, std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>>>
    : LeafTraits<T> {
  using RangeType = T;

  // Scalars always generate; the enclosing budget saturates instead
  static T NewFuzzed(Mutator &mutator, const Constraints<T> *constraints) {
    return mutator.GenNumber<T>(constraints);
  }

  static void Mutate(T &value, Mutator &mutator, const Constraints<T> *constraints) {
    mutator.MutateNumber<T>(value, constraints);
  }
};

template <> struct FuzzTraits<bool> : LeafTraits<bool> {
  using RangeType = bool;

  static bool NewFuzzed(Mutator &mutator, const Constraints<bool> *) {
    return mutator.GenChance(0.5);
  }

  static void Mutate(bool &value, Mutator &, const Constraints<bool> *) { value = !value; }
};

template <> struct FuzzTraits<RawBool> : LeafTraits<RawBool> {
  using RangeType = uint8_t;

  // Fresh values are always canonical
  static RawBool NewFuzzed(Mutator &mutator, const Constraints<uint8_t> *) {
    return RawBool(mutator.GenChance(0.5));
  }

  static void Mutate(RawBool &value, Mutator &mutator, const Constraints<uint8_t> *) {
    if (mutator.GenChance(mutator.config().non_canonical_bool_chance)) {
      value = RawBool::FromRaw(mutator.GenInclusive<uint8_t>(2, 0xFF));
      LOG_MUT_TRACE("RawBool mutated to non-canonical 0x{:02x}", value.raw());
      return;
    }
    value = RawBool(!static_cast<bool>(value));
  }
};

// ----------------------------------------------------------------------------
// Element-count helpers shared by text and sequences
// ----------------------------------------------------------------------------

namespace detail {

struct CountBounds {
  size_t lo;
  size_t hi; // exclusive
};

inline CountBounds GetCountBounds(const Mutator &mutator, const Constraints<size_t> *c) {
  CountBounds bounds{0, mutator.config().max_sequence_elements + 1};
  if (c && c->min) {
    bounds.lo = *c->min;
  }
  if (c && c->max) {
    bounds.hi = *c->max;
  }
  if (bounds.hi <= bounds.lo) {
    bounds.hi = bounds.lo + 1;
  }
  return bounds;
}

inline std::optional<size_t> GetBudget(const Constraints<size_t> *c) {
  return c ? c->max_size : std::nullopt;
}

// ----------------------------------------------------------------------------
// UTF-8
// ----------------------------------------------------------------------------

inline size_t Utf8Length(char32_t cp) {
  if (cp < 0x80) {
    return 1;
  }
  if (cp < 0x800) {
    return 2;
  }
  if (cp < 0x10000) {
    return 3;
  }
  return 4;
}

inline void AppendUtf8(std::string &out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Byte offset of every code point start
inline std::vector<size_t> CodePointOffsets(const std::string &text) {
  std::vector<size_t> offsets;
  for (size_t i = 0; i < text.size(); ++i) {
    if ((static_cast<uint8_t>(text[i]) & 0xC0) != 0x80) {
      offsets.push_back(i);
    }
  }
  return offsets;
}

/**
 * Random scalar value whose UTF-8 encoding is at most max_bytes long.
 * The encoded length is drawn first so multi-byte code points are not
 * drowned out by the much larger 4-byte plane.
 */
inline char32_t GenCodePoint(Mutator &mutator, size_t max_bytes, bool ascii) {
  if (ascii || max_bytes <= 1) {
    return static_cast<char32_t>(mutator.GenRange<uint32_t>(0, 0x80));
  }
  switch (mutator.GenInclusive<size_t>(1, std::min<size_t>(max_bytes, 4))) {
  case 1:
    return static_cast<char32_t>(mutator.GenRange<uint32_t>(0, 0x80));
  case 2:
    return static_cast<char32_t>(mutator.GenRange<uint32_t>(0x80, 0x800));
  case 3: {
    // Skip the surrogate block
    uint32_t cp = mutator.GenRange<uint32_t>(0x800, 0x10000 - 0x800);
    if (cp >= 0xD800) {
      cp += 0x800;
    }
    return static_cast<char32_t>(cp);
  }
  default:
    return static_cast<char32_t>(mutator.GenRange<uint32_t>(0x10000, 0x110000));
  }
}

} // namespace detail

// ----------------------------------------------------------------------------
// Text
// ----------------------------------------------------------------------------

/**
 * Text generation and mutation over code points
 *
 * Constraints bound the code point count; max_size bounds the encoded
 * byte length exactly, so the last code points shrink to fit the budget.
 */
template <typename S, bool kAscii> struct TextTraits : LeafTraits<S> {
  using RangeType = size_t;

  static std::string &Text(S &value) {
    if constexpr (std::is_same_v<S, std::string>) {
      return value;
    } else {
      return value.value;
    }
  }

  static S NewFuzzed(Mutator &mutator, const Constraints<size_t> *constraints) {
    const auto bounds = detail::GetCountBounds(mutator, constraints);
    const Weighted weighted = constraints ? constraints->weighted : Weighted::None;
    const size_t count = mutator.GenWeightedRange<size_t>(bounds.lo, bounds.hi, weighted);
    std::optional<size_t> budget = detail::GetBudget(constraints);

    S result{};
    std::string &text = Text(result);
    for (size_t i = 0; i < count; ++i) {
      if (budget && *budget == 0) {
        LOG_GEN_TRACE("text budget exhausted after {} of {} code points", i, count);
        break;
      }
      const char32_t cp = detail::GenCodePoint(mutator, budget ? *budget : 4, kAscii);
      detail::AppendUtf8(text, cp);
      ConsumeBudget(budget, detail::Utf8Length(cp));
    }
    return result;
  }

  static void Mutate(S &value, Mutator &mutator, const Constraints<size_t> *constraints) {
    std::string &text = Text(value);
    const auto bounds = detail::GetCountBounds(mutator, constraints);
    const auto offsets = detail::CodePointOffsets(text);
    const size_t count = offsets.size();

    size_t room = 4;
    if (constraints && constraints->max_size) {
      room = *constraints->max_size > text.size() ? *constraints->max_size - text.size() : 0;
    }

    enum Strategy { kReplace, kInsert, kRemove };
    std::vector<Strategy> allowed;
    if (count > 0) {
      allowed.push_back(kReplace);
    }
    if (count + 1 < bounds.hi && room > 0) {
      allowed.push_back(kInsert);
    }
    if (count > bounds.lo) {
      allowed.push_back(kRemove);
    }
    if (allowed.empty()) {
      return;
    }

    const size_t at = count > 0 ? mutator.GenIndex(count) : 0;
    const size_t begin = count > 0 ? offsets[at] : 0;
    const size_t end = at + 1 < count ? offsets[at + 1] : text.size();

    std::string encoded;
    switch (allowed[mutator.GenIndex(allowed.size())]) {
    case kReplace:
      // Keep the encoded width so a byte budget stays satisfied
      detail::AppendUtf8(encoded, detail::GenCodePoint(mutator, end - begin, kAscii));
      text.replace(begin, end - begin, encoded);
      break;
    case kInsert:
      detail::AppendUtf8(encoded, detail::GenCodePoint(mutator, room, kAscii));
      text.insert(begin, encoded);
      break;
    case kRemove:
      text.erase(begin, end - begin);
      break;
    }
  }
};

template <> struct FuzzTraits<std::string> : TextTraits<std::string, false> {};

template <> struct FuzzTraits<AsciiString> : TextTraits<AsciiString, true> {};

// ----------------------------------------------------------------------------
// Unit
// ----------------------------------------------------------------------------

// Zero-size alternative for payload variants
template <> struct FuzzTraits<std::monostate> {
  using RangeType = size_t;

  static std::monostate NewFuzzed(Mutator &, const Constraints<size_t> *) { return {}; }
  static void Mutate(std::monostate &, Mutator &, const Constraints<size_t> *) {}
  static void Fixup(std::monostate &, Mutator &) {}
  static void OnSuccess(const std::monostate &, const ShapeRegistry &) {}
  static size_t SerializedSize(const std::monostate &, const ShapeRegistry &) { return 0; }
  static size_t MinNonzeroElementsSize(const ShapeRegistry &) { return 0; }
  static bool IsFixedSize(const ShapeRegistry &) { return true; }
  static void BinarySerialize(const std::monostate &, codec::ByteSink &, const ShapeRegistry &) {}
};

// ----------------------------------------------------------------------------
// Sequences
// ----------------------------------------------------------------------------

namespace detail {

template <typename T> using ElementConstraints = Constraints<typename FuzzTraits<T>::RangeType>;

// Fresh element limited to what is left of the budget
template <typename T> T NewElement(Mutator &mutator, const std::optional<size_t> &budget) {
  if (!budget) {
    return FuzzTraits<T>::NewFuzzed(mutator, nullptr);
  }
  ElementConstraints<T> child;
  child.max_size = budget;
  return FuzzTraits<T>::NewFuzzed(mutator, &child);
}

} // namespace detail

/**
 * std::vector<T>: element count within [min, max), default cap
 * MutatorConfig::max_sequence_elements
 *
 * Generation stops early when the budget can no longer hold an element,
 * and an element that overruns the budget is dropped.
 */
template <typename T> struct FuzzTraits<std::vector<T>> {
  using RangeType = size_t;
  using Elem = FuzzTraits<T>;

  static std::vector<T> NewFuzzed(Mutator &mutator, const Constraints<size_t> *constraints) {
    const ShapeRegistry &registry = mutator.registry();
    const auto bounds = detail::GetCountBounds(mutator, constraints);
    const Weighted weighted = constraints ? constraints->weighted : Weighted::None;
    size_t count = mutator.GenWeightedRange<size_t>(bounds.lo, bounds.hi, weighted);
    std::optional<size_t> budget = detail::GetBudget(constraints);

    const size_t min_element = Elem::MinNonzeroElementsSize(registry);
    if (budget && min_element > *budget) {
      LOG_GEN_TRACE("sequence budget {} below element size {}, generating empty", *budget,
                    min_element);
      return {};
    }
    if (budget && min_element > 0 && Elem::IsFixedSize(registry)) {
      count = std::min(count, *budget / min_element);
    }

    std::vector<T> items;
    items.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      T item = detail::NewElement<T>(mutator, budget);
      if (budget) {
        const size_t size = Elem::SerializedSize(item, registry);
        if (size > *budget) {
          LOG_GEN_TRACE("dropping element {} ({} bytes, {} left)", i, size, *budget);
          break;
        }
        ConsumeBudget(budget, size);
      }
      items.push_back(std::move(item));
      if (budget && min_element > *budget) {
        break;
      }
    }
    return items;
  }

  static void Mutate(std::vector<T> &items, Mutator &mutator, const Constraints<size_t> *constraints) {
    const ShapeRegistry &registry = mutator.registry();
    const auto bounds = detail::GetCountBounds(mutator, constraints);

    std::optional<size_t> room;
    if (constraints && constraints->max_size) {
      const size_t used = SerializedSize(items, registry);
      room = *constraints->max_size > used ? *constraints->max_size - used : 0;
    }
    const bool can_grow = items.size() + 1 < bounds.hi &&
                          (!room || Elem::MinNonzeroElementsSize(registry) <= *room);

    enum Strategy { kMutateOne, kInsert, kRemove, kDuplicate, kTruncate };
    std::vector<Strategy> allowed;
    if (!items.empty()) {
      allowed.push_back(kMutateOne);
    }
    if (can_grow) {
      allowed.push_back(kInsert);
    }
    if (items.size() > bounds.lo) {
      allowed.push_back(kRemove);
      allowed.push_back(kTruncate);
    }
    if (!items.empty() && can_grow &&
        (!room || Elem::SerializedSize(items.front(), registry) <= *room)) {
      allowed.push_back(kDuplicate);
    }
    if (allowed.empty()) {
      return;
    }

    switch (allowed[mutator.GenIndex(allowed.size())]) {
    case kMutateOne:
      Elem::Mutate(items[mutator.GenIndex(items.size())], mutator, nullptr);
      break;
    case kInsert: {
      const size_t at = mutator.GenIndex(items.size() + 1);
      items.insert(items.begin() + at, detail::NewElement<T>(mutator, room));
      break;
    }
    case kRemove:
      items.erase(items.begin() + mutator.GenIndex(items.size()));
      break;
    case kDuplicate: {
      // Front is the element whose size was checked against the budget
      T copy = items.front();
      items.insert(items.begin() + mutator.GenIndex(items.size() + 1), std::move(copy));
      break;
    }
    case kTruncate:
      items.resize(mutator.GenRange<size_t>(bounds.lo, items.size()));
      break;
    }
  }

  static void Fixup(std::vector<T> &items, Mutator &mutator) {
    for (auto &item : items) {
      Elem::Fixup(item, mutator);
    }
  }

  static void OnSuccess(const std::vector<T> &items, const ShapeRegistry &registry) {
    for (const auto &item : items) {
      Elem::OnSuccess(item, registry);
    }
  }

  static size_t SerializedSize(const std::vector<T> &items, const ShapeRegistry &registry) {
    if (items.empty()) {
      return 0;
    }
    return codec::SequenceSerializedSize(
        items, [&](const T &item) { return Elem::SerializedSize(item, registry); });
  }

  static size_t MinNonzeroElementsSize(const ShapeRegistry &registry) {
    return Elem::MinNonzeroElementsSize(registry);
  }

  static bool IsFixedSize(const ShapeRegistry &) { return false; }

  static void BinarySerialize(const std::vector<T> &items, codec::ByteSink &sink,
                              const ShapeRegistry &registry) {
    if constexpr (std::is_same_v<T, uint8_t>) {
      sink.write_bytes(items);
    } else {
      codec::EncodeSequence(items, sink, [&](const T &item, codec::ByteSink &s) {
        Elem::BinarySerialize(item, s, registry);
      });
    }
  }
};

/**
 * std::array<T, N>: fixed element count; fixed-size whenever T is
 */
template <typename T, size_t N> struct FuzzTraits<std::array<T, N>> {
  using RangeType = size_t;
  using Elem = FuzzTraits<T>;

  static std::array<T, N> NewFuzzed(Mutator &mutator, const Constraints<size_t> *constraints) {
    const ShapeRegistry &registry = mutator.registry();
    std::optional<size_t> budget = detail::GetBudget(constraints);
    std::array<T, N> items{};
    for (auto &item : items) {
      item = detail::NewElement<T>(mutator, budget);
      ConsumeBudget(budget, Elem::SerializedSize(item, registry));
    }
    return items;
  }

  static void Mutate(std::array<T, N> &items, Mutator &mutator, const Constraints<size_t> *) {
    if constexpr (N > 0) {
      Elem::Mutate(items[mutator.GenIndex(N)], mutator, nullptr);
    }
  }

  static void Fixup(std::array<T, N> &items, Mutator &mutator) {
    for (auto &item : items) {
      Elem::Fixup(item, mutator);
    }
  }

  static void OnSuccess(const std::array<T, N> &items, const ShapeRegistry &registry) {
    for (const auto &item : items) {
      Elem::OnSuccess(item, registry);
    }
  }

  static size_t SerializedSize(const std::array<T, N> &items, const ShapeRegistry &registry) {
    return codec::SequenceSerializedSize(
        items, [&](const T &item) { return Elem::SerializedSize(item, registry); });
  }

  static size_t MinNonzeroElementsSize(const ShapeRegistry &registry) {
    return N * Elem::MinNonzeroElementsSize(registry);
  }

  static bool IsFixedSize(const ShapeRegistry &registry) { return Elem::IsFixedSize(registry); }

  static void BinarySerialize(const std::array<T, N> &items, codec::ByteSink &sink,
                              const ShapeRegistry &registry) {
    codec::EncodeSequence(items, sink, [&](const T &item, codec::ByteSink &s) {
      Elem::BinarySerialize(item, s, registry);
    });
  }
};

} // namespace fuzz
} // namespace shapefuzz
