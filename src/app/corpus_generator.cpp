#include "app/corpus_generator.hpp"
#include "app/sample_protocol.hpp"
#include "fuzz/fuzz.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/threadpool.hpp"
#include <future>
#include <stdexcept>

namespace shapefuzz {
namespace app {

CorpusGenerator::CorpusGenerator(const fuzz::ShapeRegistry &registry, CorpusConfig config)
    : registry_(registry), config_(std::move(config)) {
  if (!registry_.frozen()) {
    throw std::logic_error("CorpusGenerator requires a frozen ShapeRegistry");
  }
  config_.mutator.Validate();
}

std::string CorpusGenerator::EntryFileName(size_t index, size_t mutation) {
  std::string name = "entry-" + std::to_string(index);
  if (mutation > 0) {
    name += "-m" + std::to_string(mutation);
  }
  return name + ".bin";
}

std::vector<std::vector<uint8_t>> CorpusGenerator::GenerateEntry(size_t index) const {
  fuzz::StdRandomSource rng(config_.seed + index);
  fuzz::Mutator mutator(rng, registry_, config_.mutator);

  std::vector<std::vector<uint8_t>> generations;
  generations.reserve(config_.mutations + 1);

  Record record = fuzz::NewFuzzedWithin<Record>(mutator, config_.max_size);
  generations.push_back(fuzz::ToBytes(record, config_.endianness, registry_));

  for (size_t k = 1; k <= config_.mutations; ++k) {
    fuzz::Mutate(record, mutator);
    generations.push_back(fuzz::ToBytes(record, config_.endianness, registry_));
  }
  return generations;
}

CorpusStats CorpusGenerator::WriteEntry(size_t index) const {
  CorpusStats stats;
  stats.entries = 1;

  const auto generations = GenerateEntry(index);
  for (size_t k = 0; k < generations.size(); ++k) {
    const auto path = config_.outdir / EntryFileName(index, k);
    if (util::atomic_write_file(path, generations[k])) {
      ++stats.files_written;
      stats.bytes_written += generations[k].size();
    } else {
      ++stats.files_failed;
      LOG_APP_ERROR("failed to write corpus entry {}", path.string());
    }
  }

  // Kind byte sits right after magic and version
  constexpr size_t kKindOffset = 3;
  const auto &fresh = generations.front();
  if (fresh.size() > kKindOffset) {
    const auto kind = fuzz::FuzzTraits<fuzz::PossiblyInvalid<RecordKind, uint8_t>>::FromPrimitive(
        fresh[kKindOffset], registry_);
    if (!kind.is_valid()) {
      ++stats.invalid_kinds;
    }
  }
  return stats;
}

CorpusStats CorpusGenerator::Run() const {
  CorpusStats total;
  if (!util::ensure_directory(config_.outdir)) {
    LOG_APP_ERROR("cannot create output directory {}", config_.outdir.string());
    total.files_failed = config_.count * (config_.mutations + 1);
    return total;
  }

  LOG_APP_INFO("generating {} entries into {} (seed {}, max size {}, {} endian, {} mutations)",
               config_.count, config_.outdir.string(), config_.seed, config_.max_size,
               codec::EndiannessName(config_.endianness), config_.mutations);

  std::vector<std::future<CorpusStats>> pending;
  pending.reserve(config_.count);
  {
    util::ThreadPool pool(config_.threads);
    for (size_t i = 0; i < config_.count; ++i) {
      pending.push_back(pool.enqueue([this, i] { return WriteEntry(i); }));
    }

    // Collect in order; a failed entry rethrows here
    for (auto &future : pending) {
      const CorpusStats stats = future.get();
      total.entries += stats.entries;
      total.files_written += stats.files_written;
      total.files_failed += stats.files_failed;
      total.bytes_written += stats.bytes_written;
      total.invalid_kinds += stats.invalid_kinds;
    }
  }

  LOG_APP_INFO("wrote {} files ({} bytes, {} failed, {} with invalid kind)", total.files_written,
               total.bytes_written, total.files_failed, total.invalid_kinds);
  return total;
}

} // namespace app
} // namespace shapefuzz
