// Fuzz target for record generation, mutation and encoding
// The input bytes drive every random draw, so the fuzzer explores the
// generator's own branches: budget exhaustion, invalid discriminants,
// non-canonical booleans, early bail and every mutation strategy.

#include "app/sample_protocol.hpp"
#include "fuzz/fuzz.hpp"
#include "util/logging.hpp"
#include <cstddef>
#include <cstdint>

namespace {

using namespace shapefuzz;

// Above this budget every record shape fits, so the budget must hold
constexpr size_t kGuaranteedBudget = 64;

const fuzz::ShapeRegistry &SampleRegistry() {
  static const fuzz::ShapeRegistry &registry = [] () -> const fuzz::ShapeRegistry & {
    util::LogManager::Initialize("off");
    static fuzz::ShapeRegistry r;
    app::RegisterSampleProtocol(r);
    r.Freeze();
    return r;
  }();
  return registry;
}

void CheckEncoding(const app::Record &record, const fuzz::ShapeRegistry &registry,
                   codec::Endianness order) {
  codec::BufferSink sink(order);
  fuzz::BinarySerialize(record, sink, registry);

  // CRITICAL: size computation must agree with the encoder
  if (sink.size() != fuzz::SerializedSize(record, registry)) {
    __builtin_trap();
  }
  if (sink.has_error()) {
    __builtin_trap();
  }
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  const fuzz::ShapeRegistry &registry = SampleRegistry();
  fuzz::ByteStreamRandomSource rng(data, size);

  fuzz::MutatorConfig config;
  config.early_bail_enabled = (rng.Next() & 1) != 0;
  config.fixup_enabled = (rng.Next() & 1) != 0;
  fuzz::Mutator mutator(rng, registry, config);

  const size_t budget = static_cast<size_t>(rng.Next() % 1024);
  const auto order = (rng.Next() & 1) ? codec::Endianness::Big : codec::Endianness::Little;

  app::Record record = fuzz::NewFuzzedWithin<app::Record>(mutator, budget);
  CheckEncoding(record, registry, order);

  // CRITICAL: generation must stay within any budget the shapes can fit
  if (budget >= kGuaranteedBudget && fuzz::SerializedSize(record, registry) > budget) {
    __builtin_trap();
  }

  // Fixups keep the length field and a valid kind consistent with the body
  if (config.fixup_enabled) {
    if (record.header.payload_length != app::ExpectedPayloadLength(record, registry)) {
      __builtin_trap();
    }
    if (record.header.kind.is_valid() &&
        *record.header.kind.valid_value() != app::KindForBody(record.body)) {
      __builtin_trap();
    }
  }

  // Invalid discriminants produced by the engine are never declared values
  if (!record.header.kind.is_valid() &&
      fuzz::FuzzTraits<decltype(record.header.kind)>::FromPrimitive(
          record.header.kind.to_primitive(), registry)
          .is_valid()) {
    __builtin_trap();
  }

  // Mutation never switches the active body alternative
  for (int round = 0; round < 4 && !rng.exhausted(); ++round) {
    const size_t alternative = record.body.index();
    fuzz::Mutate(record, mutator);
    if (record.body.index() != alternative) {
      __builtin_trap();
    }
    CheckEncoding(record, registry, order);
  }

  return 0;
}
