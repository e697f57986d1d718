// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

// Umbrella header: include this rather than the individual fuzz headers
// so every FuzzTraits specialization is visible where traits are used.

#include "codec/byte_sink.hpp"
#include "codec/endian.hpp"
#include "codec/value_types.hpp"
#include "fuzz/constraints.hpp"
#include "fuzz/mutator.hpp"
#include "fuzz/mutator_config.hpp"
#include "fuzz/possibly_invalid.hpp"
#include "fuzz/random_source.hpp"
#include "fuzz/registry.hpp"
#include "fuzz/shape.hpp"
#include "fuzz/shaped_traits.hpp"
#include "fuzz/traits.hpp"
#include "fuzz/weighted_selector.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace shapefuzz {
namespace fuzz {

template <typename T> using RangeTypeOf = typename FuzzTraits<T>::RangeType;

template <typename T>
T NewFuzzed(Mutator &mutator, const Constraints<RangeTypeOf<T>> *constraints = nullptr) {
  return FuzzTraits<T>::NewFuzzed(mutator, constraints);
}

// Generate with only a byte budget
template <typename T> T NewFuzzedWithin(Mutator &mutator, size_t max_size) {
  Constraints<RangeTypeOf<T>> constraints;
  constraints.max_size = max_size;
  return FuzzTraits<T>::NewFuzzed(mutator, &constraints);
}

template <typename T>
void Mutate(T &value, Mutator &mutator, const Constraints<RangeTypeOf<T>> *constraints = nullptr) {
  FuzzTraits<T>::Mutate(value, mutator, constraints);
}

template <typename T> void Fixup(T &value, Mutator &mutator) { FuzzTraits<T>::Fixup(value, mutator); }

template <typename T> void OnSuccess(const T &value, const ShapeRegistry &registry) {
  FuzzTraits<T>::OnSuccess(value, registry);
}

template <typename T> size_t SerializedSize(const T &value, const ShapeRegistry &registry) {
  return FuzzTraits<T>::SerializedSize(value, registry);
}

template <typename T> size_t MinNonzeroElementsSize(const ShapeRegistry &registry) {
  return FuzzTraits<T>::MinNonzeroElementsSize(registry);
}

template <typename T> bool IsFixedSize(const ShapeRegistry &registry) {
  return FuzzTraits<T>::IsFixedSize(registry);
}

template <typename T>
void BinarySerialize(const T &value, codec::ByteSink &sink, const ShapeRegistry &registry) {
  FuzzTraits<T>::BinarySerialize(value, sink, registry);
}

template <typename T>
std::vector<uint8_t> ToBytes(const T &value, codec::Endianness order, const ShapeRegistry &registry) {
  codec::BufferSink sink(order);
  FuzzTraits<T>::BinarySerialize(value, sink, registry);
  return sink.release();
}

} // namespace fuzz
} // namespace shapefuzz
