// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "fuzz/constraints.hpp"
#include "fuzz/mutator_config.hpp"
#include "fuzz/random_source.hpp"
#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace shapefuzz {
namespace fuzz {

class ShapeRegistry;

/**
 * Mutator - per call tree driver for generation and mutation
 *
 * Bundles the injected RandomSource, the (frozen) ShapeRegistry that
 * describes structured types, and the MutatorConfig. Every draw the
 * engine makes goes through here, so a seeded source gives reproducible
 * output.
 *
 * Not thread-safe; give each worker its own Mutator and RandomSource.
 * The registry may be shared.
 */
class Mutator {
public:
  /**
   * @throws std::invalid_argument if config fails Validate()
   */
  Mutator(RandomSource &rng, const ShapeRegistry &registry, MutatorConfig config = {});

  Mutator(const Mutator &) = delete;
  Mutator &operator=(const Mutator &) = delete;

  RandomSource &rng() { return rng_; }
  const ShapeRegistry &registry() const { return registry_; }
  const MutatorConfig &config() const { return config_; }

  bool ShouldFixup() const { return config_.fixup_enabled; }

  // Consulted once per struct field during mutation
  bool ShouldEarlyBailMutation();

  bool GenChance(double probability);

  // Uniform index in [0, n); n must be nonzero
  size_t GenIndex(size_t n);

  // Uniformly random permutation of 0..n-1
  std::vector<size_t> Permutation(size_t n);

  // Uniform over every bit pattern of an integer type
  template <typename T> T GenFull() {
    static_assert(std::is_integral_v<T>, "GenFull requires an integer type");
    return static_cast<T>(rng_.Next());
  }

  template <typename T> T GenInclusive(T lo, T hi) {
    if (hi < lo) {
      throw std::invalid_argument("GenInclusive: empty range");
    }
    if constexpr (std::is_integral_v<T>) {
      using Wide = std::conditional_t<std::is_signed_v<T>, int64_t, uint64_t>;
      std::uniform_int_distribution<Wide> dist(static_cast<Wide>(lo), static_cast<Wide>(hi));
      return static_cast<T>(dist(rng_));
    } else {
      return GenRealRange(lo, hi);
    }
  }

  // Half-open range [lo, hi)
  template <typename T> T GenRange(T lo, T hi) {
    if (!(lo < hi)) {
      throw std::invalid_argument("GenRange: min must be less than max");
    }
    if constexpr (std::is_integral_v<T>) {
      return GenInclusive<T>(lo, static_cast<T>(hi - 1));
    } else {
      return GenRealRange(lo, hi);
    }
  }

  /**
   * Half-open range draw biased toward one end: Weighted::Min keeps the
   * smaller of two uniform draws, Weighted::Max the larger.
   */
  template <typename T> T GenWeightedRange(T lo, T hi, Weighted weighted) {
    T a = GenRange<T>(lo, hi);
    return ApplyWeight(a, weighted, [&] { return GenRange<T>(lo, hi); });
  }

  template <typename T> T GenWeightedInclusive(T lo, T hi, Weighted weighted) {
    T a = GenInclusive<T>(lo, hi);
    return ApplyWeight(a, weighted, [&] { return GenInclusive<T>(lo, hi); });
  }

  template <typename T> T PickInterestingValue();

  /**
   * Fresh number honoring optional bounds. Without bounds, a boundary
   * value is drawn with config().interesting_value_chance, otherwise any
   * bit pattern.
   */
  template <typename T> T GenNumber(const Constraints<T> *constraints);

  /**
   * In-place number mutation: bit flip, small arithmetic, boundary value
   * or full random, chosen uniformly. Results outside declared bounds are
   * redrawn inside them.
   */
  template <typename T> void MutateNumber(T &value, const Constraints<T> *constraints);

private:
  template <typename T, typename Redraw> T ApplyWeight(T first, Weighted weighted, Redraw &&redraw) {
    switch (weighted) {
    case Weighted::Min:
      return std::min(first, redraw());
    case Weighted::Max:
      return std::max(first, redraw());
    case Weighted::None:
      break;
    }
    return first;
  }

  // Interpolates so that spans wider than the type's max never overflow
  template <typename T> T GenRealRange(T lo, T hi) {
    std::uniform_real_distribution<T> unit(T(0), T(1));
    const T t = unit(rng_);
    T result = lo * (T(1) - t) + hi * t;
    if (result >= hi) {
      result = std::nextafter(hi, lo);
    }
    if (result < lo) {
      result = lo;
    }
    return result;
  }

  template <typename T> bool InBounds(const T &value, const Constraints<T> &c) const {
    if (c.min && !(value >= *c.min)) {
      return false;
    }
    if (c.max && !(value < *c.max)) {
      return false;
    }
    return true;
  }

  RandomSource &rng_;
  const ShapeRegistry &registry_;
  MutatorConfig config_;
};

// ----------------------------------------------------------------------------
// Template implementations
// ----------------------------------------------------------------------------

namespace detail {

// Common boundary values: buffer sizes, sign edges, width overflows
inline constexpr uint64_t kInterestingIntegers[] = {
    0,          1,          2,          16,         32,
    64,         100,        127,        128,        255,
    256,        512,        1000,       1024,       4096,
    32767,      32768,      65535,      65536,      0x7FFFFFFFULL,
    0x80000000ULL, 0xFFFFFFFFULL, 0x7FFFFFFFFFFFFFFFULL, 0x8000000000000000ULL,
    0xFFFFFFFFFFFFFFFFULL};

// Strategy indices for MutateNumber
enum NumberMutation : size_t {
  kBitFlip = 0,
  kArithmetic,
  kInteresting,
  kRandom,
  kNumberMutationCount,
};

// AFL's ARITH_MAX
inline constexpr int kArithMax = 35;

} // namespace detail

template <typename T> T Mutator::PickInterestingValue() {
  if constexpr (std::is_integral_v<T>) {
    constexpr size_t table = std::size(detail::kInterestingIntegers);
    const size_t i = GenIndex(table + 2);
    if (i == table) {
      return std::numeric_limits<T>::lowest();
    }
    if (i == table + 1) {
      return std::numeric_limits<T>::max();
    }
    // Narrower types keep the truncated pattern, which is still an edge
    return static_cast<T>(detail::kInterestingIntegers[i]);
  } else {
    using L = std::numeric_limits<T>;
    const T values[] = {T(0),        -T(0),       T(1),           T(-1),
                        L::infinity(), -L::infinity(), L::quiet_NaN(), L::denorm_min(),
                        L::min(),    L::max(),    L::lowest(),    L::epsilon()};
    return values[GenIndex(std::size(values))];
  }
}

template <typename T> T Mutator::GenNumber(const Constraints<T> *constraints) {
  static_assert(std::is_arithmetic_v<T>, "GenNumber requires an arithmetic type");

  if (constraints && constraints->has_bounds()) {
    const T lo = constraints->min.value_or(std::numeric_limits<T>::lowest());
    if (constraints->max) {
      return GenWeightedRange<T>(lo, *constraints->max, constraints->weighted);
    }
    return GenWeightedInclusive<T>(lo, std::numeric_limits<T>::max(), constraints->weighted);
  }

  if (GenChance(config_.interesting_value_chance)) {
    return PickInterestingValue<T>();
  }

  if constexpr (std::is_integral_v<T>) {
    return GenFull<T>();
  } else if constexpr (sizeof(T) == sizeof(uint32_t)) {
    return std::bit_cast<T>(GenFull<uint32_t>());
  } else {
    return std::bit_cast<T>(GenFull<uint64_t>());
  }
}

template <typename T> void Mutator::MutateNumber(T &value, const Constraints<T> *constraints) {
  static_assert(std::is_arithmetic_v<T>, "MutateNumber requires an arithmetic type");

  using Bits = std::conditional_t<
      std::is_integral_v<T>, std::make_unsigned_t<std::conditional_t<std::is_integral_v<T>, T, int>>,
      std::conditional_t<sizeof(T) == sizeof(uint32_t), uint32_t, uint64_t>>;

  switch (GenIndex(detail::kNumberMutationCount)) {
  case detail::kBitFlip: {
    Bits bits = std::bit_cast<Bits>(value);
    bits ^= static_cast<Bits>(Bits(1) << GenIndex(sizeof(Bits) * 8));
    value = std::bit_cast<T>(bits);
    break;
  }
  case detail::kArithmetic: {
    const int delta = GenInclusive<int>(1, detail::kArithMax);
    if constexpr (std::is_integral_v<T>) {
      // Unsigned arithmetic wraps instead of overflowing
      Bits bits = static_cast<Bits>(value);
      bits = GenChance(0.5) ? static_cast<Bits>(bits + static_cast<Bits>(delta))
                            : static_cast<Bits>(bits - static_cast<Bits>(delta));
      value = static_cast<T>(bits);
    } else {
      value = GenChance(0.5) ? value + static_cast<T>(delta) : value - static_cast<T>(delta);
    }
    break;
  }
  case detail::kInteresting:
    value = PickInterestingValue<T>();
    break;
  default:
    value = GenNumber<T>(nullptr);
    break;
  }

  if (constraints && constraints->has_bounds() && !InBounds(value, *constraints)) {
    value = GenNumber<T>(constraints);
  }
}

} // namespace fuzz
} // namespace shapefuzz
