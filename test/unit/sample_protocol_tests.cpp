// Unit tests for the sample record protocol
#include <catch2/catch_test_macros.hpp>
#include "app/sample_protocol.hpp"

using namespace shapefuzz;
using namespace shapefuzz::app;
using shapefuzz::fuzz::Mutator;
using shapefuzz::fuzz::MutatorConfig;
using shapefuzz::fuzz::ShapeRegistry;
using shapefuzz::fuzz::StdRandomSource;

namespace {

size_t CountCodePoints(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        count += (static_cast<uint8_t>(c) & 0xC0) != 0x80;
    }
    return count;
}

void RequireConsistent(const Record& r, const ShapeRegistry& registry) {
    REQUIRE(r.header.payload_length == ExpectedPayloadLength(r, registry));
    if (r.header.kind.is_valid()) {
        REQUIRE(r.header.kind.valid_value() == KindForBody(r.body));
    }
    REQUIRE(fuzz::SerializedSize(r, registry) == sample::kHeaderSize + r.header.payload_length);
}

} // namespace

TEST_CASE("Sample protocol - registration", "[app][sample]") {
    ShapeRegistry registry;
    RegisterSampleProtocol(registry);
    registry.Freeze();

    REQUIRE(registry.size() == 6);
    REQUIRE(registry.Contains<Record>());
    REQUIRE(registry.Contains<RecordBody>());
    REQUIRE(fuzz::IsFixedSize<RecordHeader>(registry));
    REQUIRE(fuzz::MinNonzeroElementsSize<RecordHeader>(registry) == sample::kHeaderSize);
    REQUIRE_FALSE(fuzz::IsFixedSize<Record>(registry));
}

TEST_CASE("Sample protocol - fresh records", "[app][sample]") {
    ShapeRegistry registry;
    RegisterSampleProtocol(registry);
    registry.Freeze();

    StdRandomSource rng(51);
    Mutator mutator(rng, registry);

    for (int i = 0; i < 300; ++i) {
        Record r = fuzz::NewFuzzedWithin<Record>(mutator, 128);

        REQUIRE(r.header.magic == sample::kRecordMagic);
        REQUIRE(r.header.version >= sample::kMinVersion);
        REQUIRE(r.header.version < sample::kMaxVersion);
        REQUIRE(r.header.urgent.is_canonical());
        REQUIRE(r.header.kind.valid_value() != RecordKind::Reset);
        REQUIRE(CountCodePoints(r.comment) <= sample::kMaxCommentCodePoints);
        REQUIRE(fuzz::SerializedSize(r, registry) <= 128);

        if (const auto* data = std::get_if<DataBody>(&r.body)) {
            REQUIRE(data->bytes.size() <= sample::kMaxDataBytes);
        } else {
            REQUIRE(std::get<AckBody>(r.body).window >= 1);
        }

        RequireConsistent(r, registry);
    }
}

TEST_CASE("Sample protocol - wire layout", "[app][sample]") {
    ShapeRegistry registry;
    RegisterSampleProtocol(registry);
    registry.Freeze();

    Record r;
    r.header.magic = sample::kRecordMagic;
    r.header.version = 2;
    r.header.kind = fuzz::PossiblyInvalid<RecordKind, uint8_t>::Invalid(0x33);
    r.header.urgent = RawBool::FromRaw(0x07);
    r.header.payload_length = 6;
    r.body = AckBody{0x01020304, 0x0506};

    SECTION("Big endian") {
        auto bytes = fuzz::ToBytes(r, codec::Endianness::Big, registry);
        REQUIRE(bytes == std::vector<uint8_t>{0x53, 0x46, 0x02, 0x33, 0x07, 0x00, 0x00, 0x00, 0x06,
                                              0x01, 0x02, 0x03, 0x04, 0x05, 0x06});
    }

    SECTION("Little endian") {
        auto bytes = fuzz::ToBytes(r, codec::Endianness::Little, registry);
        REQUIRE(bytes == std::vector<uint8_t>{0x46, 0x53, 0x02, 0x33, 0x07, 0x06, 0x00, 0x00, 0x00,
                                              0x04, 0x03, 0x02, 0x01, 0x06, 0x05});
    }

    SECTION("Comment trails the body") {
        r.comment = "ok";
        auto bytes = fuzz::ToBytes(r, codec::Endianness::Big, registry);
        REQUIRE(bytes.size() == sample::kHeaderSize + 6 + 2);
        REQUIRE(bytes[bytes.size() - 2] == 'o');
        REQUIRE(bytes.back() == 'k');
    }
}

TEST_CASE("Sample protocol - mutation", "[app][sample]") {
    ShapeRegistry registry;
    RegisterSampleProtocol(registry);
    registry.Freeze();

    StdRandomSource rng(52);

    SECTION("Fixup keeps the length in step") {
        Mutator mutator(rng, registry);
        Record r = fuzz::NewFuzzedWithin<Record>(mutator, 256);
        const size_t alternative = r.body.index();
        for (int i = 0; i < 300; ++i) {
            fuzz::Mutate(r, mutator);
            REQUIRE(r.body.index() == alternative);
            REQUIRE(r.header.version >= sample::kMinVersion);
            REQUIRE(r.header.version < sample::kMaxVersion);
            RequireConsistent(r, registry);
        }
    }

    SECTION("Invalid kinds survive fixup") {
        MutatorConfig config;
        config.invalid_discriminant_chance = 1.0;
        config.interesting_value_chance = 0.0;
        Mutator mutator(rng, registry, config);
        for (int i = 0; i < 50; ++i) {
            Record r = fuzz::NewFuzzedWithin<Record>(mutator, 256);
            REQUIRE_FALSE(r.header.kind.is_valid());
            REQUIRE_FALSE(registry.GetEnum<RecordKind>().IsDeclared(
                static_cast<RecordKind>(r.header.kind.to_primitive())));
        }
    }
}
