// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#include <bit-uuid/bit_field.h>

using namespace buuid;
using namespace std::literals;

#define ARR(...) std::array<uint8_t, std::size({__VA_ARGS__})>{{__VA_ARGS__}}


TEST_SUITE("bit_field") {

static constexpr auto v1_table = make_bit_layout({32, 16, 4, 12, 2, 14, 48});

static_assert(v1_table.size() == 7);
static_assert(v1_table[0] == bit_field{0, 32});
static_assert(v1_table[2] == bit_field{48, 4});
static_assert(v1_table[4] == bit_field{64, 2});
static_assert(v1_table[6] == bit_field{80, 48});

static_assert(make_bit_layout({128})[0] == bit_field{0, 128});
static_assert(make_bit_layout({1, 127})[1] == bit_field{1, 127});

static_assert([]() {
    std::array<uint8_t, 16> buf{};
    write_bits(buf, {48, 4}, 7);
    return read_bits(buf, {48, 4}) == 7 && buf[6] == 0x70;
}());

TEST_CASE("layout offsets") {
    constexpr auto table = make_bit_layout({48, 4, 12, 2, 62});

    unsigned expected_offset = 0;
    for (auto & field: table) {
        CHECK(field.offset == expected_offset);
        expected_offset += field.width;
    }
    CHECK(expected_offset == 128);
}

TEST_CASE("read") {
    auto buf = ARR(0xc2, 0x32, 0xab, 0x00, 0x94, 0x14, 0x11, 0xec, 0xb3, 0xc8, 0x9f, 0x6b, 0xde, 0xce, 0xd8, 0x46);

    CHECK(read_bits(buf, v1_table[0]) == 0xC232AB00);
    CHECK(read_bits(buf, v1_table[1]) == 0x9414);
    CHECK(read_bits(buf, v1_table[2]) == 1);
    CHECK(read_bits(buf, v1_table[3]) == 0x1EC);
    CHECK(read_bits(buf, v1_table[4]) == 0b10);
    CHECK(read_bits(buf, v1_table[5]) == 0x33C8);
    CHECK(read_bits(buf, v1_table[6]) == 0x9F6BDECED846);

    CHECK(read_bits(buf, {0, 128}) == u128(0xc232ab00941411ec, 0xb3c89f6bdeced846));
    CHECK(read_bits(buf, {127, 1}) == 0);
    CHECK(read_bits(buf, {0, 1}) == 1);
}

TEST_CASE("write preserves other bits") {
    std::array<uint8_t, 16> buf;
    buf.fill(0xFF);

    write_bits(buf, {60, 8}, 0);
    CHECK_EQUAL_SEQ(buf, ARR(0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xF0, 0x0F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF));

    write_bits(buf, {60, 8}, 0xA5);
    CHECK(buf[7] == 0xFA);
    CHECK(buf[8] == 0x5F);
    CHECK(read_bits(buf, {60, 8}) == 0xA5);
}

TEST_CASE("write masks the value") {
    std::array<uint8_t, 16> buf{};

    write_bits(buf, {0, 4}, 0x1F);
    CHECK(buf[0] == 0xF0);
    CHECK(read_bits(buf, {4, 124}) == 0);

    write_bits(buf, {126, 2}, ~impl::uint128_t(0));
    CHECK(buf[15] == 0x03);
    CHECK(read_bits(buf, {4, 122}) == 0);
}

TEST_CASE("full width") {
    std::array<uint8_t, 16> buf{};
    const auto val = u128(0x0011223344556677, 0x8899aabbccddeeff);

    write_bits(buf, {0, 128}, val);
    CHECK_EQUAL_SEQ(buf, ARR(0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88, 0x99, 0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff));
    CHECK(read_bits(buf, {0, 128}) == val);
}

TEST_CASE("fields are independent") {
    constexpr auto table = make_bit_layout({48, 4, 12, 2, 62});
    std::array<uint8_t, 16> buf{};

    write_bits(buf, table[0], 0xFFFFFFFFFFFF);
    write_bits(buf, table[4], impl::low_bits_mask(62));
    CHECK(read_bits(buf, table[1]) == 0);
    CHECK(read_bits(buf, table[2]) == 0);
    CHECK(read_bits(buf, table[3]) == 0);

    write_bits(buf, table[2], 0xABC);
    CHECK(read_bits(buf, table[0]) == 0xFFFFFFFFFFFF);
    CHECK(read_bits(buf, table[2]) == 0xABC);
    CHECK(read_bits(buf, table[4]) == impl::low_bits_mask(62));
}

}
