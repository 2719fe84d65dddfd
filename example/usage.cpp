// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <fmt/format.h>

#include <bit-uuid/layouts.h>
#include <bit-uuid/node_id.h>

#include <exception>

using namespace buuid;

int main() {
    try {
        random_generator gen;

        auto v4 = uuid_v4(gen);
        fmt::print("v4: {}\n", v4.to_uuid());

        fast_clock_sequence<unix_ms_timestamp> unix_seq;
        auto v7 = uuid_v7::now(unix_seq);
        fmt::print("v7: {}\n", v7.to_uuid());

        auto v5 = uuid_v5(uuid::namespaces::dns, "example.com");
        fmt::print("v5: {}\n", v5.to_uuid());

        safe_clock_sequence<gregorian_timestamp> gregorian_seq;
        auto v1 = uuid_v1::now(gregorian_seq, 0x001122334455);
        fmt::print("v1: {}\n", v1.to_uuid());

        auto v6 = uuid_v6::now(gregorian_seq, make_node_id());
        fmt::print("v6: {:u}\n", v6.to_uuid());

        uuid from_bytes(v4.to_bytes());
        fmt::print("round-trip: {}\n", from_bytes == v4.to_uuid());

        fmt::print("v7 > v4: {}\n", v7.to_uuid() > v4.to_uuid());

        if (auto layout = get_layout(uuid::parse("017f22e2-79b0-7cc3-98c4-dc0c0c07398f"))) {
            if (auto * parsed = std::get_if<uuid_v7>(&*layout))
                fmt::print("parsed v7 timestamp: {} ms\n", parsed->unix_ts_ms());
        }

        fmt::print("nil: {}\n", uuid());
        fmt::print("max: {}\n", uuid::max());
    } catch (std::exception & ex) {
        fmt::print(stderr, "error: {}\n", ex.what());
        return 1;
    }
    return 0;
}
