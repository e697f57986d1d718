// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "fuzz/mutator.hpp"
#include <numeric>

namespace shapefuzz {
namespace fuzz {

Mutator::Mutator(RandomSource &rng, const ShapeRegistry &registry, MutatorConfig config)
    : rng_(rng), registry_(registry), config_(config) {
  config_.Validate();
}

bool Mutator::ShouldEarlyBailMutation() {
  if (!config_.early_bail_enabled) {
    return false;
  }
  return GenChance(config_.early_bail_chance);
}

bool Mutator::GenChance(double probability) {
  if (probability <= 0.0) {
    return false;
  }
  if (probability >= 1.0) {
    return true;
  }
  std::bernoulli_distribution dist(probability);
  return dist(rng_);
}

size_t Mutator::GenIndex(size_t n) {
  if (n == 0) {
    throw std::invalid_argument("GenIndex: empty range");
  }
  std::uniform_int_distribution<size_t> dist(0, n - 1);
  return dist(rng_);
}

std::vector<size_t> Mutator::Permutation(size_t n) {
  std::vector<size_t> order(n);
  std::iota(order.begin(), order.end(), size_t{0});
  std::shuffle(order.begin(), order.end(), rng_);
  return order;
}

} // namespace fuzz
} // namespace shapefuzz
