// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#include <bit-uuid/layouts.h>

#include <random>
#include <set>
#include <vector>
#include <iostream>

using namespace buuid;
using namespace std::literals;

TEST_SUITE("layouts") {

//RFC 9562 examples use 2022-02-22 19:22:22 UTC
constexpr uint64_t rfc_gregorian_tick = 0x1EC9414C232AB00;
constexpr uint16_t rfc_clock_seq = 0x33C8;
constexpr uint64_t rfc_node = 0x9F6BDECED846;

static_assert(std::is_trivially_copyable_v<uuid_v1>);
static_assert(std::is_trivially_copyable_v<uuid_v7>);
static_assert(sizeof(uuid_v4) == sizeof(uuid));
static_assert(std::totally_ordered<uuid_v6>);
static_assert(std::is_convertible_v<uuid_v8, uuid>);
static_assert(!std::is_default_constructible_v<uuid_v1>);

TEST_CASE("v1") {
    constexpr uuid expected("c232ab00-9414-11ec-b3c8-9f6bdeced846");

    auto decoded = uuid_v1::from_uuid(expected);
    REQUIRE(decoded);
    CHECK(decoded->time_low() == 0xC232AB00);
    CHECK(decoded->time_mid() == 0x9414);
    CHECK(decoded->time_high() == 0x1EC);
    CHECK(decoded->clock_seq() == rfc_clock_seq);
    CHECK(decoded->node() == rfc_node);
    CHECK(decoded->time() == rfc_gregorian_tick);
    CHECK(decoded->get(uuid_v1::fields::version) == 1);
    CHECK(decoded->get(uuid_v1::fields::variant) == 0b10);

    constexpr uuid_v1 built(gregorian_timestamp{rfc_gregorian_tick, rfc_clock_seq}, rfc_node);
    static_assert(built.to_uuid() == expected);
    CHECK(built == *decoded);
    CHECK(built.timestamp() == gregorian_timestamp{rfc_gregorian_tick, rfc_clock_seq});
    CHECK(built.to_string() == "c232ab00-9414-11ec-b3c8-9f6bdeced846");
}

TEST_CASE("v2") {
    constexpr uuid val("000003e8-cbb9-21ea-b201-00045a86c8a1");

    auto decoded = uuid_v2::from_uuid(val);
    REQUIRE(decoded);
    CHECK(decoded->high() == 0x000003E8CBB9);
    CHECK(decoded->mid() == 0x1EA);
    CHECK(decoded->low() == 0x320100045A86C8A1);
    CHECK(decoded->get_version() == uuid::version::dce_security);
    CHECK(decoded->to_uuid() == val);
}

TEST_CASE("v3") {
    uuid_v3 u1(uuid::namespaces::dns, "www.example.com");
    CHECK(u1 == uuid("5df41881-3aed-3515-88a7-2f4a814cf09e"));
    CHECK(u1.md5_high() == 0x5df418813aed);
    CHECK(u1.md5_mid() == 0x515);
    CHECK(u1.md5_low() == 0x08a72f4a814cf09e);
    CHECK(u1.md5() == ((impl::uint128_t(0x5df418813aed) << 74) | (impl::uint128_t(0x515) << 62) | 0x08a72f4a814cf09e));

    uuid_v3 u2(uuid::namespaces::dns, "www.widgets.com"s);
    CHECK(u2 == uuid("3d813cbb-47fb-32ba-91df-831e1593ac29"));

    const uint8_t name[] = {'w', 'w', 'w', '.', 'w', 'i', 'd', 'g', 'e', 't', 's', '.', 'c', 'o', 'm'};
    CHECK(uuid_v3(uuid::namespaces::dns, std::span<const uint8_t>(name)) == u2);

    CHECK(uuid_v3(uuid::namespaces::dns, "www.example.com") == u1);
    CHECK(uuid_v3(uuid::namespaces::url, "www.example.com") == uuid("a777199a-c522-31c4-8f4b-335feec7215b"));
    CHECK(uuid_v3(uuid::namespaces::url, "www.example.com") != u1);
    CHECK(uuid_v3(uuid::namespaces::dns, "") != uuid_v3(uuid::namespaces::url, ""));
}

TEST_CASE("v4") {
    constexpr uuid expected("919108f7-52d1-4320-9bac-f847db4148a8");

    auto decoded = uuid_v4::from_uuid(expected);
    REQUIRE(decoded);
    CHECK(decoded->random_a() == 0x919108f752d1);
    CHECK(decoded->random_b() == 0x320);
    CHECK(decoded->random_c() == 0x1bacf847db4148a8);

    std::mt19937_64 gen1(42), gen2(42), gen3(43);
    CHECK(uuid_v4(gen1) == uuid_v4(gen2));
    CHECK(uuid_v4(gen1) != uuid_v4(gen3));

    auto u1 = uuid_v4::generate();
    auto u2 = uuid_v4::generate();
    CHECK(u1 != u2);
    CHECK(u1.get_variant() == uuid::variant::rfc9562);
    CHECK(u1.to_uuid().get_version() == uuid::version::random);

    std::cout << "v4: " << u1 << '\n';
}

TEST_CASE("v4 uniqueness") {
    random_generator gen;
    std::set<uuid> seen;
    for (int i = 0; i < 10'000; ++i) {
        uuid_v4 u(gen);
        CHECK(u.get(uuid_v4::fields::version) == 4);
        CHECK(u.get(uuid_v4::fields::variant) == 0b10);
        seen.insert(u);
    }
    CHECK(seen.size() == 10'000);
}

TEST_CASE("v5") {
    uuid_v5 u1(uuid::namespaces::dns, "www.example.com");
    CHECK(u1 == uuid("2ed6657d-e927-568b-95e1-2665a8aea6a2"));
    CHECK(u1.sha1_high() == 0x2ed6657de927);
    CHECK(u1.sha1_mid() == 0x68b);
    CHECK(u1.sha1_low() == 0x15e12665a8aea6a2);

    uuid_v5 u2(uuid::namespaces::dns, "www.widgets.com");
    CHECK(u2 == uuid("21f7f8de-8051-5b89-8680-0195ef798b6a"));

    CHECK(uuid_v5(uuid::namespaces::dns, "www.example.com") == u1);
    CHECK(uuid_v5(uuid::namespaces::oid, "www.example.com") != u1);
}

TEST_CASE("v6") {
    constexpr uuid expected("1ec9414c-232a-6b00-b3c8-9f6bdeced846");

    auto decoded = uuid_v6::from_uuid(expected);
    REQUIRE(decoded);
    CHECK(decoded->time_high() == 0x1EC9414C);
    CHECK(decoded->time_mid() == 0x232A);
    CHECK(decoded->time_low() == 0xB00);
    CHECK(decoded->clock_seq() == rfc_clock_seq);
    CHECK(decoded->node() == rfc_node);
    CHECK(decoded->time() == rfc_gregorian_tick);

    constexpr uuid_v6 built(gregorian_timestamp{rfc_gregorian_tick, rfc_clock_seq}, rfc_node);
    CHECK(built.to_uuid() == expected);

    //same instant as the v1 example
    auto v1 = uuid_v1::from_uuid(uuid("c232ab00-9414-11ec-b3c8-9f6bdeced846"));
    REQUIRE(v1);
    CHECK(v1->timestamp() == built.timestamp());

    uuid_v6 later(gregorian_timestamp{rfc_gregorian_tick + 1, 0}, 0);
    CHECK(built < later);
}

TEST_CASE("v7") {
    constexpr uuid expected("017f22e2-79b0-7cc3-98c4-dc0c0c07398f");

    auto decoded = uuid_v7::from_uuid(expected);
    REQUIRE(decoded);
    CHECK(decoded->unix_ts_ms() == 0x017F22E279B0);
    CHECK(decoded->rand_a() == 0xCC3);
    CHECK(decoded->rand_b() == 0x18C4DC0C0C07398F);

    const auto seq = (impl::uint128_t(0xCC3) << 62) | 0x18C4DC0C0C07398F;
    CHECK(decoded->sequence() == seq);

    uuid_v7 built(unix_ms_timestamp{0x017F22E279B0, seq});
    CHECK(built.to_uuid() == expected);
    CHECK(built.timestamp() == unix_ms_timestamp{0x017F22E279B0, seq});

    unix_ms_timestamp ts1{0x017F22E279B0, unix_ms_timestamp::max_seq};
    unix_ms_timestamp ts2{0x017F22E279B0 + 1, 0};
    CHECK(uuid_v7(ts1) < uuid_v7(ts2));
}

TEST_CASE("v8") {
    constexpr auto payload_b1 = (impl::uint128_t(0x2489E9AD2EE2) << 74) | (impl::uint128_t(0xE00) << 62) | 0x0EC932D5F69181C0;
    constexpr uuid_v8 b1(payload_b1);
    CHECK(b1 == uuid("2489e9ad-2ee2-8e00-8ec9-32d5f69181c0"));
    CHECK(b1.custom_a() == 0x2489E9AD2EE2);
    CHECK(b1.custom_b() == 0xE00);
    CHECK(b1.custom_c() == 0x0EC932D5F69181C0);
    CHECK(b1.custom() == payload_b1);

    constexpr auto payload_b2 = (impl::uint128_t(0x5c146b143c52) << 74) | (impl::uint128_t(0xafd) << 62) | 0x138a375d0df1fbf6;
    uuid_v8 b2(payload_b2);
    CHECK(b2 == uuid("5c146b14-3c52-8afd-938a-375d0df1fbf6"));

    //bits above 122 are dropped
    uuid_v8 truncated(~impl::uint128_t(0));
    CHECK(truncated.custom() == impl::low_bits_mask(uuid_v8::payload_bits));
    CHECK(truncated.to_uuid() == uuid("ffffffff-ffff-8fff-bfff-ffffffffffff"));
}

TEST_CASE("from_uuid rejects mismatches") {
    constexpr uuid v4("919108f7-52d1-4320-9bac-f847db4148a8");

    CHECK(!uuid_v1::from_uuid(v4));
    CHECK(!uuid_v7::from_uuid(v4));
    CHECK(uuid_v4::from_uuid(v4));

    //version 4 nibble with NCS variant
    CHECK(!uuid_v4::from_uuid(uuid("919108f7-52d1-4320-1bac-f847db4148a8")));
    //microsoft variant
    CHECK(!uuid_v4::from_uuid(uuid("919108f7-52d1-4320-dbac-f847db4148a8")));

    CHECK(!uuid_v1::from_uuid(uuid()));
    CHECK(!uuid_v8::from_uuid(uuid::max()));
}

TEST_CASE("get_layout") {
    auto version_of = [](const uuid & val) -> std::optional<uuid::version> {
        auto layout = get_layout(val);
        if (!layout)
            return std::nullopt;
        return std::visit([](const auto & l) { return l.get_version(); }, *layout);
    };

    CHECK(version_of(uuid()) == uuid::version::nil);
    CHECK(version_of(uuid::max()) == uuid::version::max);
    CHECK(version_of(uuid("c232ab00-9414-11ec-b3c8-9f6bdeced846")) == uuid::version::time_based);
    CHECK(version_of(uuid("000003e8-cbb9-21ea-b201-00045a86c8a1")) == uuid::version::dce_security);
    CHECK(version_of(uuid("5df41881-3aed-3515-88a7-2f4a814cf09e")) == uuid::version::name_based_md5);
    CHECK(version_of(uuid("919108f7-52d1-4320-9bac-f847db4148a8")) == uuid::version::random);
    CHECK(version_of(uuid("2ed6657d-e927-568b-95e1-2665a8aea6a2")) == uuid::version::name_based_sha1);
    CHECK(version_of(uuid("1ec9414c-232a-6b00-b3c8-9f6bdeced846")) == uuid::version::reordered_time_based);
    CHECK(version_of(uuid("017f22e2-79b0-7cc3-98c4-dc0c0c07398f")) == uuid::version::unix_time_based);
    CHECK(version_of(uuid("2489e9ad-2ee2-8e00-8ec9-32d5f69181c0")) == uuid::version::custom);

    CHECK(!get_layout(uuid("919108f7-52d1-4320-1bac-f847db4148a8")));
    CHECK(!get_layout(uuid("919108f7-52d1-9320-9bac-f847db4148a8")));

    auto layout = get_layout(uuid("017f22e2-79b0-7cc3-98c4-dc0c0c07398f"));
    REQUIRE(layout);
    REQUIRE(std::holds_alternative<uuid_v7>(*layout));
    CHECK(std::get<uuid_v7>(*layout).unix_ts_ms() == 0x017F22E279B0);

    auto nil_layout = get_layout(uuid());
    REQUIRE(nil_layout);
    CHECK(std::holds_alternative<uuid_nil>(*nil_layout));
    CHECK(std::get<uuid_nil>(*nil_layout).to_uuid().is_nil());
}

TEST_CASE("constructed values are compliant") {
    std::mt19937_64 gen(7);
    const gregorian_timestamp gts{rfc_gregorian_tick, rfc_clock_seq};
    const std::vector<std::pair<uuid, uuid::version>> values = {
        {uuid_v1(gts, rfc_node), uuid::version::time_based},
        {uuid_v3(uuid::namespaces::x500, "cn=test"), uuid::version::name_based_md5},
        {uuid_v4(gen), uuid::version::random},
        {uuid_v5(uuid::namespaces::x500, "cn=test"), uuid::version::name_based_sha1},
        {uuid_v6(gts, rfc_node), uuid::version::reordered_time_based},
        {uuid_v7(unix_ms_timestamp{1, 1}), uuid::version::unix_time_based},
        {uuid_v8(0), uuid::version::custom},
    };

    for (auto & [val, ver]: values) {
        CAPTURE(val);
        CHECK(val.get_variant() == uuid::variant::rfc9562);
        CHECK(val.get_version() == ver);
    }
}

TEST_CASE("generated values round trip") {
    random_generator gen;
    safe_clock_sequence<gregorian_timestamp> gregorian_seq;
    fast_clock_sequence<unix_ms_timestamp> unix_seq;

    std::vector<uuid> values;
    for (int i = 0; i < 100; ++i) {
        values.push_back(uuid_v1::now(gregorian_seq, 0x001122334455));
        values.push_back(uuid_v4(gen));
        values.push_back(uuid_v7::now(unix_seq));
    }

    for (auto & val: values) {
        CAPTURE(val);
        CHECK(uuid::parse(val.to_string()) == val);
        CHECK(uuid::from_chars(val.to_string(uuid::uppercase)) == val);
        CHECK(uuid(val.to_bytes()) == val);
        CHECK(uuid::from_big(val.to_big()) == val);
    }
}

TEST_CASE("integer views") {
    uuid_v5 u(uuid::namespaces::dns, "www.example.com");

    CHECK(u.to_native() == u.to_uuid().to_native());
    CHECK(uuid::from_big(u.to_big()) == u.to_uuid());
    CHECK(uuid::from_little(u.to_little()) == u.to_uuid());
    CHECK(u.to_bytes() == u.to_uuid().bytes);
    CHECK_EQUAL_SEQ(u.as_bytes(), u.to_uuid().bytes);
}

}
