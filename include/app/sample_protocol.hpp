#pragma once

#include "codec/value_types.hpp"
#include "fuzz/fuzz.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace shapefuzz {
namespace app {

/**
 * Sample record protocol
 *
 * A small length-prefixed record format used by the corpus tool and the
 * fuzz harness. Wire layout (all multi-byte fields in the chosen byte
 * order, no padding):
 *
 *   magic(2) version(1) kind(1) urgent(1) payload_length(4)
 *   body: DataBody  = sequence(4) bytes(n)
 *         AckBody   = sequence(4) window(2)
 *   comment: UTF-8, rest of the record
 *
 * payload_length covers body and comment and is repaired by the record
 * fixup hook. A valid kind is also kept in step with the body; invalid
 * kinds are left alone so targets see mismatches.
 */
namespace sample {

constexpr uint16_t kRecordMagic = 0x5346; // "SF"
constexpr uint8_t kMinVersion = 1;
constexpr uint8_t kMaxVersion = 4; // exclusive
constexpr size_t kMaxDataBytes = 48;
constexpr size_t kMaxCommentCodePoints = 24;

// magic + version + kind + urgent + payload_length
constexpr size_t kHeaderSize = 2 + 1 + 1 + 1 + 4;

} // namespace sample

enum class RecordKind : uint8_t {
  Data = 1,
  Ack = 2,
  Reset = 0x7F, // declared but never generated
};

struct RecordHeader {
  uint16_t magic{0};
  uint8_t version{0};
  fuzz::PossiblyInvalid<RecordKind, uint8_t> kind;
  RawBool urgent;
  uint32_t payload_length{0};
};

struct DataBody {
  uint32_t sequence{0};
  std::vector<uint8_t> bytes;
};

struct AckBody {
  uint32_t sequence{0};
  uint16_t window{0};
};

using RecordBody = std::variant<DataBody, AckBody>;

struct Record {
  RecordHeader header;
  RecordBody body;
  std::string comment;
};

/**
 * Register every sample protocol shape. The caller freezes the registry.
 */
void RegisterSampleProtocol(fuzz::ShapeRegistry &registry);

// Bytes after the header, as payload_length should report them
size_t ExpectedPayloadLength(const Record &record, const fuzz::ShapeRegistry &registry);

// The kind a well-formed record would carry for its body
RecordKind KindForBody(const RecordBody &body);

} // namespace app
} // namespace shapefuzz
