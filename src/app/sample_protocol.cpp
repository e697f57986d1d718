#include "app/sample_protocol.hpp"
#include "util/logging.hpp"

namespace shapefuzz {
namespace app {

using fuzz::Weighted;

void RegisterSampleProtocol(fuzz::ShapeRegistry &registry) {
  registry.DefineEnum<RecordKind>("RecordKind")
      .Variant(RecordKind::Data, "data")
      .Weight(3)
      .Variant(RecordKind::Ack, "ack")
      .Variant(RecordKind::Reset, "reset")
      .Ignore();

  auto &header = registry.DefineStruct<RecordHeader>("RecordHeader");
  header.Field("magic", &RecordHeader::magic).Initializer([] { return sample::kRecordMagic; });
  header.Field("version", &RecordHeader::version)
      .Min(sample::kMinVersion)
      .Max(sample::kMaxVersion)
      .Bias(Weighted::Max);
  header.Field("kind", &RecordHeader::kind);
  header.Field("urgent", &RecordHeader::urgent);
  header.Field("payload_length", &RecordHeader::payload_length);

  auto &data = registry.DefineStruct<DataBody>("DataBody");
  data.Field("sequence", &DataBody::sequence);
  data.Field("bytes", &DataBody::bytes).Max(sample::kMaxDataBytes + 1);

  auto &ack = registry.DefineStruct<AckBody>("AckBody");
  ack.Field("sequence", &AckBody::sequence);
  ack.Field("window", &AckBody::window).Min(1).Bias(Weighted::Min);

  registry.DefineVariant<RecordBody>("RecordBody").Name(0, "data").Weight(0, 3).Name(1, "ack");

  auto &record = registry.DefineStruct<Record>("Record");
  record.Field("header", &Record::header);
  record.Field("body", &Record::body);
  record.Field("comment", &Record::comment).Max(sample::kMaxCommentCodePoints + 1);
  record.OnFixup([](Record &r, fuzz::Mutator &mutator) {
    const size_t payload = ExpectedPayloadLength(r, mutator.registry());
    r.header.payload_length = static_cast<uint32_t>(payload);
    if (r.header.kind.is_valid()) {
      r.header.kind = fuzz::PossiblyInvalid<RecordKind, uint8_t>::Valid(KindForBody(r.body));
    }
  });

  LOG_APP_INFO("registered sample record protocol ({} shapes)", registry.size());
}

size_t ExpectedPayloadLength(const Record &record, const fuzz::ShapeRegistry &registry) {
  return fuzz::SerializedSize(record.body, registry) + fuzz::SerializedSize(record.comment, registry);
}

RecordKind KindForBody(const RecordBody &body) {
  return std::holds_alternative<AckBody>(body) ? RecordKind::Ack : RecordKind::Data;
}

} // namespace app
} // namespace shapefuzz
