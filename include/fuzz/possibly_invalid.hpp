// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "codec/primitive_codec.hpp"
#include "fuzz/registry.hpp"
#include "fuzz/traits.hpp"
#include "util/logging.hpp"
#include <optional>
#include <type_traits>
#include <variant>

namespace shapefuzz {
namespace fuzz {

/**
 * PossiblyInvalid<E, P> - an enum discriminant that may hold any raw P
 *
 * Valid(E) is a declared variant of E. Invalid(P) carries an arbitrary
 * backing value so targets see discriminants they never expected. Both
 * encode as exactly sizeof(P) bytes.
 */
template <typename E, typename P> class PossiblyInvalid {
  static_assert(std::is_enum_v<E>, "PossiblyInvalid requires an enumeration type");
  static_assert(std::is_integral_v<P> && !std::is_same_v<P, bool>,
                "PossiblyInvalid backing type must be an integer");

public:
  PossiblyInvalid() : value_(std::in_place_index<0>, E{}) {}

  static PossiblyInvalid Valid(E value) {
    PossiblyInvalid v;
    v.value_.template emplace<0>(value);
    return v;
  }

  static PossiblyInvalid Invalid(P raw) {
    PossiblyInvalid v;
    v.value_.template emplace<1>(raw);
    return v;
  }

  bool is_valid() const { return value_.index() == 0; }

  std::optional<E> valid_value() const {
    if (is_valid()) {
      return std::get<0>(value_);
    }
    return std::nullopt;
  }

  // The backing number that goes on the wire
  P to_primitive() const {
    if (is_valid()) {
      return static_cast<P>(std::get<0>(value_));
    }
    return std::get<1>(value_);
  }

  friend bool operator==(const PossiblyInvalid &a, const PossiblyInvalid &b) {
    return a.value_ == b.value_;
  }

private:
  std::variant<E, P> value_;
};

template <typename E, typename P> struct FuzzTraits<PossiblyInvalid<E, P>> {
  using RangeType = P;
  using Value = PossiblyInvalid<E, P>;

  // Give up on finding an undeclared pattern after this many draws
  static constexpr int kMaxInvalidAttempts = 16;

  static Value NewFuzzed(Mutator &mutator, const Constraints<P> *) {
    if (mutator.GenChance(mutator.config().invalid_discriminant_chance)) {
      if (auto invalid = DrawInvalid(mutator)) {
        return *invalid;
      }
    }
    return Value::Valid(FuzzTraits<E>::NewFuzzed(mutator, nullptr));
  }

  /**
   * Valid values either turn invalid or redraw a declared variant.
   * Invalid values have their raw number mutated and become Valid again
   * if the result happens to be declared.
   */
  static void Mutate(Value &value, Mutator &mutator, const Constraints<P> *) {
    if (value.is_valid()) {
      if (mutator.GenChance(mutator.config().invalid_discriminant_chance)) {
        if (auto invalid = DrawInvalid(mutator)) {
          value = *invalid;
          return;
        }
      }
      value = Value::Valid(FuzzTraits<E>::NewFuzzed(mutator, nullptr));
      return;
    }

    P raw = value.to_primitive();
    mutator.MutateNumber<P>(raw, nullptr);
    value = FromPrimitive(raw, mutator.registry());
  }

  static void Fixup(Value &, Mutator &) {}
  static void OnSuccess(const Value &, const ShapeRegistry &) {}

  static size_t SerializedSize(const Value &, const ShapeRegistry &) { return sizeof(P); }
  static size_t MinNonzeroElementsSize(const ShapeRegistry &) { return sizeof(P); }
  static bool IsFixedSize(const ShapeRegistry &) { return true; }

  static void BinarySerialize(const Value &value, codec::ByteSink &sink, const ShapeRegistry &) {
    codec::Codec<P>::Encode(value.to_primitive(), sink);
  }

  // Valid when raw matches a declared variant, Invalid otherwise
  static Value FromPrimitive(P raw, const ShapeRegistry &registry) {
    for (const auto &variant : registry.GetEnum<E>().variants()) {
      if (static_cast<P>(variant.value) == raw) {
        return Value::Valid(variant.value);
      }
    }
    return Value::Invalid(raw);
  }

private:
  static std::optional<Value> DrawInvalid(Mutator &mutator) {
    for (int attempt = 0; attempt < kMaxInvalidAttempts; ++attempt) {
      Value candidate = FromPrimitive(mutator.GenNumber<P>(nullptr), mutator.registry());
      if (!candidate.is_valid()) {
        return candidate;
      }
    }
    LOG_GEN_TRACE("no undeclared discriminant found in {} draws", kMaxInvalidAttempts);
    return std::nullopt;
  }
};

} // namespace fuzz
} // namespace shapefuzz
