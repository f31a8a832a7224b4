/**
 * @file test_pack212.cpp
 * @brief Unit tests for 12-bit pair packing and frame normalization.
 */

#include <catch2/catch_test_macros.hpp>
#include <holterwfdb/error.hpp>
#include <holterwfdb/pack212.hpp>

using namespace holterwfdb;

TEST_CASE("pack12 bit layout", "[pack]") {
    SECTION("odd code in the high 12 bits") {
        REQUIRE(pack12(0x123, 0x456) == 0x456123U);
    }

    SECTION("negative codes use two's complement") {
        // 20 -> 0x014, -40 -> 0xFD8
        REQUIRE(pack12(20, -40) == 0xFD8014U);
        REQUIRE(pack12(-1, -1) == 0xFFFFFFU);
    }

    SECTION("result fits in 24 bits") {
        REQUIRE(pack12(-32768, 32767) <= 0xFFFFFFU);
    }
}

TEST_CASE("pack12 wraps instead of clamping", "[pack]") {
    // One past the signed 12-bit maximum lands on the minimum
    REQUIRE(pack12(2048, 0) == pack12(-2048, 0));
    REQUIRE(pack12(0, 2048) == pack12(0, -2048));
    REQUIRE(unpack12(pack12(2048, 2048)) == SamplePair{-2048, -2048});

    REQUIRE(pack12(4095, 0) == pack12(-1, 0));
    REQUIRE(unpack12(pack12(4096, 2047)) == SamplePair{0, 2047});
}

TEST_CASE("pack12 round trip over the signed 12-bit range", "[pack]") {
    std::size_t mismatches = 0;
    for (int even = -2048; even <= 2047; ++even) {
        for (int odd = -2048; odd <= 2047; odd += 7) {
            SamplePair pair = unpack12(pack12(even, odd));
            if (pair.even != even || pair.odd != odd) {
                ++mismatches;
            }
        }
        // Cover every odd value for a few even values too
        if (even % 511 == 0) {
            for (int odd = -2048; odd <= 2047; ++odd) {
                SamplePair pair = unpack12(pack12(even, odd));
                if (pair.even != even || pair.odd != odd) {
                    ++mismatches;
                }
            }
        }
    }
    REQUIRE(mismatches == 0);

    REQUIRE(unpack12(pack12(-2048, 2047)) == SamplePair{-2048, 2047});
    REQUIRE(unpack12(pack12(2047, -2048)) == SamplePair{2047, -2048});
}

TEST_CASE("sign_extend12", "[pack]") {
    REQUIRE(sign_extend12(0x000) == 0);
    REQUIRE(sign_extend12(0x7FF) == 2047);
    REQUIRE(sign_extend12(0x800) == -2048);
    REQUIRE(sign_extend12(0xFFF) == -1);
    REQUIRE(sign_extend12(0xF001) == 1); // bits above 12 ignored
}

TEST_CASE("normalize_frame_count retained samples", "[pack][normalize]") {
    // n: 0  1  2  3  4  5  6  7  8  9 10  11  12  13
    const std::size_t expected[] = {0, 0, 0, 0, 0, 6, 6, 6, 6, 6, 6, 12, 12, 12};
    for (std::size_t n = 0; n < 14; ++n) {
        INFO("n = " << n);
        REQUIRE(retained_sample_count(n) == expected[n]);
        REQUIRE(normalize_frame_count(n) * NUM_CHANNELS == expected[n]);
        REQUIRE(normalize_frame_count(n) % 2 == 0);
    }
}

TEST_CASE("normalize_frame_count larger inputs", "[pack][normalize]") {
    REQUIRE(normalize_frame_count(18) == 6);
    REQUIRE(normalize_frame_count(17) == 6);
    REQUIRE(normalize_frame_count(19) == 6);  // 20 -> 6 frames
    REQUIRE(normalize_frame_count(23) == 8);  // 24 -> 8 frames
    REQUIRE(normalize_frame_count(8, 2) == 4);
    REQUIRE(normalize_frame_count(7, 1) == 8); // padded to 8
    REQUIRE(normalize_frame_count(100, 0) == 0);
}

TEST_CASE("packed_size", "[pack]") {
    REQUIRE(packed_size(0) == 0);
    REQUIRE(packed_size(2) == 9);
    REQUIRE(packed_size(6) == 27);
}

TEST_CASE("pack_frames emission order", "[pack]") {
    // Two frames of three channels
    std::vector<std::int16_t> codes = {1, 2, 3, 4, 5, 6};
    std::vector<std::uint8_t> bytes = pack_frames(codes);

    REQUIRE(bytes.size() == 9);
    // Channel 0: even=1, odd=4 -> 0x004001
    REQUIRE(bytes[0] == 0x01);
    REQUIRE(bytes[1] == 0x40);
    REQUIRE(bytes[2] == 0x00);
    // Channel 1: even=2, odd=5 -> 0x005002
    REQUIRE(bytes[3] == 0x02);
    REQUIRE(bytes[4] == 0x50);
    REQUIRE(bytes[5] == 0x00);
    // Channel 2: even=3, odd=6 -> 0x006003
    REQUIRE(bytes[6] == 0x03);
    REQUIRE(bytes[7] == 0x60);
    REQUIRE(bytes[8] == 0x00);
}

TEST_CASE("pack_frames normalization", "[pack]") {
    SECTION("odd count duplicates the last sample") {
        // 5 samples -> 6: frame 1 = {4, 5, 5}
        std::vector<std::int16_t> codes = {1, 2, 3, 4, 5};
        std::vector<std::uint8_t> bytes = pack_frames(codes);
        REQUIRE(bytes.size() == 9);

        std::vector<std::int16_t> decoded = unpack_frames(bytes.data(), bytes.size());
        std::vector<std::int16_t> expected = {1, 2, 3, 4, 5, 5};
        REQUIRE(decoded == expected);
    }

    SECTION("odd frame count drops the last frame") {
        std::vector<std::int16_t> codes = {1, 2, 3, 4, 5, 6, 7, 8, 9};
        std::vector<std::uint8_t> bytes = pack_frames(codes);
        REQUIRE(bytes.size() == 9);
        // 9 samples pad to 10 -> 3 frames -> 2 frames
        std::vector<std::int16_t> decoded = unpack_frames(bytes.data(), bytes.size());
        std::vector<std::int16_t> expected = {1, 2, 3, 4, 5, 6};
        REQUIRE(decoded == expected);
    }

    SECTION("too few samples produce no output") {
        REQUIRE(pack_frames({}).empty());
        REQUIRE(pack_frames({7}).empty());
        REQUIRE(pack_frames({1, 2, 3, 4}).empty());
    }
}

TEST_CASE("unpack_frames round trip", "[pack]") {
    std::vector<std::int16_t> codes;
    for (int i = 0; i < 60; ++i) {
        codes.push_back(static_cast<std::int16_t>((i * 137) % 4096 - 2048));
    }
    std::vector<std::uint8_t> bytes = pack_frames(codes);
    REQUIRE(bytes.size() == packed_size(20));
    REQUIRE(unpack_frames(bytes.data(), bytes.size()) == codes);
}

TEST_CASE("unpack_frames rejects partial pairs", "[pack]") {
    std::vector<std::uint8_t> bytes(10, 0);
    REQUIRE_THROWS_AS(unpack_frames(bytes.data(), bytes.size()), InvalidDataException);
    REQUIRE(unpack_frames(bytes.data(), 0).empty());
}
