// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "fuzz/random_source.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

namespace shapefuzz {
namespace fuzz {

/**
 * WeightedSelector - draws outcome i with probability weight_i / total
 *
 * Weights need not be normalized. All validation happens in the
 * constructor (empty input, zero total, overflowing total all throw
 * std::invalid_argument); a draw is one uniform sample plus a binary
 * search over the cumulative weights, so a selector built once can be
 * reused for millions of draws. Zero-weight outcomes are never drawn.
 *
 * Draws are const: one selector may be shared by threads that each use
 * their own RandomSource.
 */
template <typename Outcome> class WeightedSelector {
public:
  explicit WeightedSelector(std::vector<std::pair<uint64_t, Outcome>> choices) {
    if (choices.empty()) {
      throw std::invalid_argument("WeightedSelector requires at least one outcome");
    }

    cumulative_.reserve(choices.size());
    outcomes_.reserve(choices.size());

    uint64_t total = 0;
    for (auto &[weight, outcome] : choices) {
      if (weight > std::numeric_limits<uint64_t>::max() - total) {
        throw std::invalid_argument("WeightedSelector total weight overflows");
      }
      total += weight;
      cumulative_.push_back(total);
      outcomes_.push_back(std::move(outcome));
    }

    if (total == 0) {
      throw std::invalid_argument("WeightedSelector total weight is zero");
    }
  }

  size_t SampleIndex(RandomSource &rng) const {
    std::uniform_int_distribution<uint64_t> dist(0, total_weight() - 1);
    const uint64_t point = dist(rng);
    // First cumulative bound strictly above the point; zero-weight entries
    // share their predecessor's bound and can never be returned.
    auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), point);
    return static_cast<size_t>(it - cumulative_.begin());
  }

  const Outcome &Sample(RandomSource &rng) const { return outcomes_[SampleIndex(rng)]; }

  size_t size() const { return outcomes_.size(); }
  uint64_t total_weight() const { return cumulative_.back(); }
  const Outcome &outcome(size_t index) const { return outcomes_.at(index); }

private:
  std::vector<uint64_t> cumulative_;
  std::vector<Outcome> outcomes_;
};

} // namespace fuzz
} // namespace shapefuzz
