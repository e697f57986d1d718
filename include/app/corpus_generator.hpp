#pragma once

#include "codec/endian.hpp"
#include "fuzz/mutator_config.hpp"
#include "fuzz/registry.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace shapefuzz {
namespace app {

// Corpus tool configuration
struct CorpusConfig {
  std::filesystem::path outdir{"corpus"};

  // Entries to generate; entry i uses seed + i
  size_t count{16};
  uint64_t seed{0};

  // Byte budget for each freshly generated record
  size_t max_size{256};

  codec::Endianness endianness{codec::Endianness::Little};

  // Mutated descendants written per entry (entry-<i>-m<k>.bin)
  size_t mutations{0};

  // Worker threads (0 = hardware concurrency)
  size_t threads{0};

  fuzz::MutatorConfig mutator;
};

struct CorpusStats {
  size_t entries{0};
  size_t files_written{0};
  size_t files_failed{0};
  size_t bytes_written{0};
  size_t invalid_kinds{0};

  bool ok() const { return files_failed == 0; }
};

/**
 * CorpusGenerator - writes sample protocol records as fuzzing seeds
 *
 * Entry i is generated from its own StdRandomSource seeded with
 * seed + i, so any entry can be reproduced on its own and the output does
 * not depend on the thread count.
 */
class CorpusGenerator {
public:
  // registry must be frozen and have the sample protocol registered
  CorpusGenerator(const fuzz::ShapeRegistry &registry, CorpusConfig config);

  /**
   * Encoded generations of entry `index`: element 0 is the fresh record,
   * element k the record after k mutation rounds.
   */
  std::vector<std::vector<uint8_t>> GenerateEntry(size_t index) const;

  // Generate and write every entry on a thread pool
  CorpusStats Run() const;

  static std::string EntryFileName(size_t index, size_t mutation);

  const CorpusConfig &config() const { return config_; }

private:
  CorpusStats WriteEntry(size_t index) const;

  const fuzz::ShapeRegistry &registry_;
  CorpusConfig config_;
};

} // namespace app
} // namespace shapefuzz
