// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>

namespace shapefuzz {
namespace fuzz {

/**
 * Tunables for one Mutator
 *
 * Chances are probabilities in [0, 1].
 */
struct MutatorConfig {
  // Run fixup passes after generation / mutation
  bool fixup_enabled{true};

  // Allow struct mutation to stop after any field
  bool early_bail_enabled{false};
  double early_bail_chance{0.5};

  // PossiblyInvalid values: chance of producing an undeclared discriminant
  double invalid_discriminant_chance{0.05};

  // RawBool mutation: chance of writing a byte other than 0/1
  double non_canonical_bool_chance{0.02};

  // Unconstrained numbers: chance of drawing a boundary value
  double interesting_value_chance{0.2};

  // Element / code point count cap when no max is declared
  size_t max_sequence_elements{64};

  /**
   * Throws std::invalid_argument on out-of-range chances or a zero
   * element cap
   */
  void Validate() const;
};

nlohmann::json MutatorConfigToJson(const MutatorConfig &config);

/**
 * Missing keys keep their defaults. Throws nlohmann::json::exception on
 * type mismatches and std::invalid_argument if the result fails Validate().
 */
MutatorConfig MutatorConfigFromJson(const nlohmann::json &j);

/**
 * Read a JSON config file. Logs and returns std::nullopt if the file is
 * unreadable, malformed or invalid.
 */
std::optional<MutatorConfig> LoadMutatorConfig(const std::filesystem::path &path);

} // namespace fuzz
} // namespace shapefuzz
