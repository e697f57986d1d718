// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "fuzz/mutator_config.hpp"
#include "util/logging.hpp"
#include <fstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace shapefuzz {
namespace fuzz {

namespace {

void CheckChance(const char *name, double value) {
  if (!(value >= 0.0 && value <= 1.0)) {
    throw std::invalid_argument(std::string("MutatorConfig: ") + name +
                                " must be within [0, 1]");
  }
}

} // namespace

void MutatorConfig::Validate() const {
  CheckChance("early_bail_chance", early_bail_chance);
  CheckChance("invalid_discriminant_chance", invalid_discriminant_chance);
  CheckChance("non_canonical_bool_chance", non_canonical_bool_chance);
  CheckChance("interesting_value_chance", interesting_value_chance);
  if (max_sequence_elements == 0) {
    throw std::invalid_argument("MutatorConfig: max_sequence_elements must be nonzero");
  }
}

json MutatorConfigToJson(const MutatorConfig &config) {
  return {{"fixup_enabled", config.fixup_enabled},
          {"early_bail_enabled", config.early_bail_enabled},
          {"early_bail_chance", config.early_bail_chance},
          {"invalid_discriminant_chance", config.invalid_discriminant_chance},
          {"non_canonical_bool_chance", config.non_canonical_bool_chance},
          {"interesting_value_chance", config.interesting_value_chance},
          {"max_sequence_elements", config.max_sequence_elements}};
}

MutatorConfig MutatorConfigFromJson(const json &j) {
  MutatorConfig config;
  config.fixup_enabled = j.value("fixup_enabled", config.fixup_enabled);
  config.early_bail_enabled = j.value("early_bail_enabled", config.early_bail_enabled);
  config.early_bail_chance = j.value("early_bail_chance", config.early_bail_chance);
  config.invalid_discriminant_chance =
      j.value("invalid_discriminant_chance", config.invalid_discriminant_chance);
  config.non_canonical_bool_chance =
      j.value("non_canonical_bool_chance", config.non_canonical_bool_chance);
  config.interesting_value_chance =
      j.value("interesting_value_chance", config.interesting_value_chance);
  config.max_sequence_elements =
      j.value("max_sequence_elements", config.max_sequence_elements);
  config.Validate();
  return config;
}

std::optional<MutatorConfig> LoadMutatorConfig(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("MutatorConfig: cannot open {}", path.string());
    return std::nullopt;
  }

  try {
    json j;
    file >> j;
    if (!j.is_object()) {
      LOG_ERROR("MutatorConfig: {} does not contain a JSON object", path.string());
      return std::nullopt;
    }
    MutatorConfig config = MutatorConfigFromJson(j);
    LOG_DEBUG("MutatorConfig: loaded {}", path.string());
    return config;
  } catch (const std::exception &e) {
    LOG_ERROR("MutatorConfig: failed to parse {}: {}", path.string(), e.what());
    return std::nullopt;
  }
}

} // namespace fuzz
} // namespace shapefuzz
