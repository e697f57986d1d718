// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace shapefuzz {
namespace fuzz {

/**
 * Which end of a numeric range sampling is biased toward
 */
enum class Weighted : uint8_t {
  None, // uniform
  Min,
  Max,
};

/**
 * Constraints a generator or mutator should try to respect
 *
 * T is the type the bounds apply to: the value itself for numbers, the
 * element (or code point) count for sequences and text.
 *
 * max_size is the remaining byte budget. It is consumed with saturating
 * subtraction and never wraps below zero.
 */
template <typename T> struct Constraints {
  std::optional<T> min;
  std::optional<T> max; // exclusive
  Weighted weighted{Weighted::None};
  std::optional<size_t> max_size;

  bool has_bounds() const { return min.has_value() || max.has_value(); }

  /**
   * Throws std::invalid_argument when both bounds are set and min >= max
   */
  void Validate() const {
    if (min && max && !(*min < *max)) {
      throw std::invalid_argument("constraint min must be strictly less than max");
    }
  }

  static Constraints Range(T lo, T hi, Weighted w = Weighted::None) {
    Constraints c;
    c.min = lo;
    c.max = hi;
    c.weighted = w;
    c.Validate();
    return c;
  }

  static Constraints Budget(size_t max_size) {
    Constraints c;
    c.max_size = max_size;
    return c;
  }
};

/**
 * Deduct a child's serialized size from a remaining budget. Returns true
 * when the child overran what was left (the budget is clamped to zero).
 */
inline bool ConsumeBudget(std::optional<size_t> &budget, size_t used) {
  if (!budget) {
    return false;
  }
  if (used > *budget) {
    *budget = 0;
    return true;
  }
  *budget -= used;
  return false;
}

} // namespace fuzz
} // namespace shapefuzz
