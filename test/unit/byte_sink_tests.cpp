// Unit tests for byte sinks
#include <catch2/catch_test_macros.hpp>
#include "codec/byte_sink.hpp"
#include <sstream>
#include <vector>

using namespace shapefuzz::codec;

TEST_CASE("BufferSink - byte order", "[codec][byte_sink]") {
    SECTION("Big endian u16") {
        BufferSink sink(Endianness::Big);
        sink.write_uint16(0x0102);
        REQUIRE(sink.data() == std::vector<uint8_t>{0x01, 0x02});
    }

    SECTION("Little endian u16") {
        BufferSink sink(Endianness::Little);
        sink.write_uint16(0x0102);
        REQUIRE(sink.data() == std::vector<uint8_t>{0x02, 0x01});
    }

    SECTION("Big endian u32 and u64") {
        BufferSink sink(Endianness::Big);
        sink.write_uint32(0x01020304);
        sink.write_uint64(0x0102030405060708ULL);
        REQUIRE(sink.data() == std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04,
                                                    0x01, 0x02, 0x03, 0x04,
                                                    0x05, 0x06, 0x07, 0x08});
    }

    SECTION("Single bytes are order independent") {
        BufferSink big(Endianness::Big);
        BufferSink little(Endianness::Little);
        big.write_uint8(0xAB);
        little.write_uint8(0xAB);
        REQUIRE(big.data() == little.data());
    }

    SECTION("Floats follow the sink order") {
        BufferSink sink(Endianness::Big);
        sink.write_float(1.0f);
        REQUIRE(sink.data() == std::vector<uint8_t>{0x3F, 0x80, 0x00, 0x00});
    }
}

TEST_CASE("BufferSink - bulk writes", "[codec][byte_sink]") {
    BufferSink sink(Endianness::Big);
    std::vector<uint8_t> bytes = {0x10, 0x20, 0x30};

    sink.write_bytes(bytes);
    sink.write_bytes(nullptr, 0);

    REQUIRE(sink.data() == bytes);
    REQUIRE(sink.bytes_written() == 3);
    REQUIRE_FALSE(sink.has_error());

    auto released = sink.release();
    REQUIRE(released == bytes);
}

TEST_CASE("StreamSink - error latch", "[codec][byte_sink]") {
    SECTION("Healthy stream") {
        std::ostringstream out;
        StreamSink sink(out, Endianness::Little);
        sink.write_uint32(0x04030201);
        REQUIRE_FALSE(sink.has_error());
        REQUIRE(out.str() == std::string("\x01\x02\x03\x04", 4));
        REQUIRE(sink.bytes_written() == 4);
    }

    SECTION("Failed stream latches and drops further writes") {
        std::ostringstream out;
        out.setstate(std::ios::badbit);
        StreamSink sink(out, Endianness::Little);

        sink.write_uint8(0x01);
        REQUIRE(sink.has_error());

        sink.write_uint16(0x0203);
        REQUIRE(sink.has_error());
        REQUIRE(sink.bytes_written() == 0);
    }
}
