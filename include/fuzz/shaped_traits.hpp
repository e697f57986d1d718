// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "fuzz/registry.hpp"
#include "fuzz/traits.hpp"
#include <type_traits>
#include <variant>

namespace shapefuzz {
namespace fuzz {

template <typename T> struct IsStdVariant : std::false_type {};
template <typename... Ts> struct IsStdVariant<std::variant<Ts...>> : std::true_type {};

// Registered structs
template <typename T>
struct ShapedTraits<T, std::enable_if_t<std::is_class_v<T> && !IsStdVariant<T>::value>> {
  using RangeType = size_t;

  static const StructShape<T> &Shape(const ShapeRegistry &registry) {
    return registry.GetStruct<T>();
  }

  static T NewFuzzed(Mutator &mutator, const Constraints<size_t> *constraints) {
    return Shape(mutator.registry()).Generate(mutator, constraints);
  }

  // Fixup and on-success passes run inside StructShape::Mutate
  static void Mutate(T &value, Mutator &mutator, const Constraints<size_t> *) {
    Shape(mutator.registry()).Mutate(value, mutator);
  }

  static void Fixup(T &value, Mutator &mutator) { Shape(mutator.registry()).Fixup(value, mutator); }

  static void OnSuccess(const T &value, const ShapeRegistry &registry) {
    Shape(registry).OnSuccess(value, registry);
  }

  static size_t SerializedSize(const T &value, const ShapeRegistry &registry) {
    return Shape(registry).SerializedSize(value, registry);
  }

  static size_t MinNonzeroElementsSize(const ShapeRegistry &registry) {
    return Shape(registry).MinNonzeroElementsSize(registry);
  }

  static bool IsFixedSize(const ShapeRegistry &registry) { return Shape(registry).IsFixedSize(registry); }

  static void BinarySerialize(const T &value, codec::ByteSink &sink, const ShapeRegistry &registry) {
    Shape(registry).BinarySerialize(value, sink, registry);
  }
};

// Registered unit enums
template <typename E> struct ShapedTraits<E, std::enable_if_t<std::is_enum_v<E>>> : LeafTraits<E> {
  using RangeType = size_t;

  static E NewFuzzed(Mutator &mutator, const Constraints<size_t> *) {
    return mutator.registry().GetEnum<E>().Generate(mutator);
  }

  // A unit enum has no payload to tweak; mutation is a fresh draw
  static void Mutate(E &value, Mutator &mutator, const Constraints<size_t> *) {
    value = mutator.registry().GetEnum<E>().Generate(mutator);
  }
};

// Registered std::variant payload sums
template <typename... Ts> struct ShapedTraits<std::variant<Ts...>, void> {
  using RangeType = size_t;
  using VariantType = std::variant<Ts...>;

  static const VariantShape<VariantType> &Shape(const ShapeRegistry &registry) {
    return registry.GetVariant<VariantType>();
  }

  static VariantType NewFuzzed(Mutator &mutator, const Constraints<size_t> *constraints) {
    VariantType value = Shape(mutator.registry()).Generate(mutator, constraints);
    if (mutator.ShouldFixup()) {
      Fixup(value, mutator);
    }
    return value;
  }

  static void Mutate(VariantType &value, Mutator &mutator, const Constraints<size_t> *) {
    Shape(mutator.registry()).Mutate(value, mutator);
    if (mutator.ShouldFixup()) {
      Fixup(value, mutator);
    }
  }

  static void Fixup(VariantType &value, Mutator &mutator) {
    std::visit(
        [&](auto &alternative) {
          FuzzTraits<std::decay_t<decltype(alternative)>>::Fixup(alternative, mutator);
        },
        value);
  }

  static void OnSuccess(const VariantType &value, const ShapeRegistry &registry) {
    std::visit(
        [&](const auto &alternative) {
          FuzzTraits<std::decay_t<decltype(alternative)>>::OnSuccess(alternative, registry);
        },
        value);
  }

  static size_t SerializedSize(const VariantType &value, const ShapeRegistry &registry) {
    return std::visit(
        [&](const auto &alternative) {
          return FuzzTraits<std::decay_t<decltype(alternative)>>::SerializedSize(alternative, registry);
        },
        value);
  }

  static size_t MinNonzeroElementsSize(const ShapeRegistry &registry) {
    return Shape(registry).MinNonzeroElementsSize(registry);
  }

  static bool IsFixedSize(const ShapeRegistry &registry) { return Shape(registry).IsFixedSize(registry); }

  // Only the held alternative is written; no tag
  static void BinarySerialize(const VariantType &value, codec::ByteSink &sink,
                              const ShapeRegistry &registry) {
    std::visit(
        [&](const auto &alternative) {
          FuzzTraits<std::decay_t<decltype(alternative)>>::BinarySerialize(alternative, sink, registry);
        },
        value);
  }
};

} // namespace fuzz
} // namespace shapefuzz
