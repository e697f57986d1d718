// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>

namespace shapefuzz {
namespace fuzz {

/**
 * Injected source of randomness
 *
 * Satisfies UniformRandomBitGenerator, so it can drive the standard
 * distributions and std::shuffle directly. One instance per call tree;
 * instances are not thread-safe.
 */
class RandomSource {
public:
  using result_type = uint64_t;

  virtual ~RandomSource() = default;

  virtual uint64_t Next() = 0;

  static constexpr result_type min() { return 0; }
  static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }
  result_type operator()() { return Next(); }
};

/**
 * Seeded mt19937_64; equal seeds yield equal draw sequences
 */
class StdRandomSource : public RandomSource {
public:
  explicit StdRandomSource(uint64_t seed) : engine_(seed) {}

  uint64_t Next() override { return engine_(); }

private:
  std::mt19937_64 engine_;
};

/**
 * Replays a byte buffer as draws, eight little-endian bytes per Next()
 *
 * Lets a coverage-guided fuzzer steer generation through its input. Once
 * the buffer runs out, draws continue from an mt19937_64 with a fixed
 * seed, so the same input always produces the same value. The tail
 * must not be constant: uniform_int_distribution rejects a zero draw for
 * most range sizes. The buffer must outlive the source.
 */
class ByteStreamRandomSource : public RandomSource {
public:
  static constexpr uint64_t kTailSeed = 0x5EED5EED5EED5EEDULL;

  ByteStreamRandomSource(const uint8_t *data, size_t size)
      : data_(data), size_(size), tail_(kTailSeed) {}

  uint64_t Next() override;

  bool exhausted() const { return pos_ >= size_; }
  size_t consumed() const { return pos_; }

private:
  const uint8_t *data_;
  size_t size_;
  size_t pos_{0};
  std::mt19937_64 tail_;
};

} // namespace fuzz
} // namespace shapefuzz
