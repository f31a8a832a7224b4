/**
 * @file test_byte_io.cpp
 * @brief Unit tests for ByteReader, ByteBuffer and the endian helpers.
 */

#include <catch2/catch_test_macros.hpp>
#include <holterwfdb/byte_buffer.hpp>
#include <holterwfdb/byte_reader.hpp>

using namespace holterwfdb;

TEST_CASE("Little-endian field helpers", "[byteio]") {
    SECTION("u16") {
        std::uint8_t data[] = {0xFA, 0x00};
        REQUIRE(read_u16_le(data) == 250);
    }

    SECTION("u16 high byte") {
        std::uint8_t data[] = {0x88, 0x13};
        REQUIRE(read_u16_le(data) == 5000);
    }

    SECTION("i16 negative") {
        std::uint8_t data[] = {0x9C, 0xFF};
        REQUIRE(read_i16_le(data) == -100);
    }

    SECTION("i16 extremes") {
        std::uint8_t min[] = {0x00, 0x80};
        std::uint8_t max[] = {0xFF, 0x7F};
        REQUIRE(read_i16_le(min) == -32768);
        REQUIRE(read_i16_le(max) == 32767);
    }

    SECTION("write u24 drops the fourth byte") {
        std::uint8_t out[4] = {0xAA, 0xAA, 0xAA, 0xAA};
        write_u24_le(out, 0x12FD8014U);
        REQUIRE(out[0] == 0x14);
        REQUIRE(out[1] == 0x80);
        REQUIRE(out[2] == 0xFD);
        REQUIRE(out[3] == 0xAA);
    }
}

TEST_CASE("ByteReader sequential reads", "[byteio]") {
    std::uint8_t data[] = {0x01, 0x02, 0xFE, 0xFF, 0x00, 0x00, 0xC6, 0x07, 0x42};
    ByteReader reader(data, sizeof(data));

    REQUIRE(reader.remaining() == 9);
    REQUIRE(reader.read_u16() == 0x0201);
    REQUIRE(reader.read_i16() == -2);
    REQUIRE(reader.position() == 4);
    REQUIRE(reader.read_i32_pdp() == 1990);
    REQUIRE(reader.read_u8() == 0x42);
    REQUIRE(reader.remaining() == 0);
}

TEST_CASE("ByteReader past the end", "[byteio]") {
    std::uint8_t data[] = {0x7F};
    ByteReader reader(data, 1);

    SECTION("u16 returns 0 without advancing") {
        REQUIRE(reader.read_u16() == 0);
        REQUIRE(reader.position() == 0);
        REQUIRE(reader.read_u8() == 0x7F);
    }

    SECTION("skip clamps") {
        reader.skip(10);
        REQUIRE(reader.remaining() == 0);
        REQUIRE(reader.read_u8() == 0);
    }
}

TEST_CASE("ByteBuffer appends little-endian", "[byteio]") {
    ByteBuffer buffer;
    buffer.append_u8(0x11);
    buffer.append_u16(0xFC17);
    buffer.append_u24(0x00FD8014U);
    buffer.append_i32_pdp(0x00010002);

    REQUIRE(buffer.size() == 10);
    std::vector<std::uint8_t> bytes = buffer.take();
    std::vector<std::uint8_t> expected = {0x11, 0x17, 0xFC, 0x14, 0x80, 0xFD,
                                          0x01, 0x00, 0x02, 0x00};
    REQUIRE(bytes == expected);
}

TEST_CASE("ByteBuffer and ByteReader agree on PDP-11 order", "[byteio]") {
    ByteBuffer buffer;
    buffer.append_i32_pdp(-5);
    buffer.append_i32_pdp(70000);

    ByteReader reader(buffer.data(), buffer.size());
    REQUIRE(reader.read_i32_pdp() == -5);
    REQUIRE(reader.read_i32_pdp() == 70000);
}
