// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_BIT_UUID_NODE_ID_H_INCLUDED
#define HEADER_BIT_UUID_NODE_ID_H_INCLUDED

#include <bit-uuid/random.h>


namespace buuid {

    /// Width of the node field of version 1 and 6 UUIDs
    constexpr unsigned node_id_bits = 48;

    /// Multicast bit of an IEEE 802 address placed in the node field
    constexpr uint64_t node_id_multicast_bit = 0x0100'0000'0000;

    /// How to obtain a node id for make_node_id()
    enum class node_id_kind {
        /// Use the MAC address of a network card if available, random otherwise
        detect_system,
        /// Always use a random value
        generate_random
    };

    /**
     * Returns the MAC address of the first network interface that has a non-zero one
     *
     * The result is the 48-bit address in its natural (first octet most significant) order.
     * Returns std::nullopt if no interface could be queried.
     */
    BUUID_EXPORTED auto detect_node_id() -> std::optional<uint64_t>;

    /**
     * Returns a random 48-bit node id.
     *
     * The multicast bit is set so that the value cannot collide with an
     * address of a real network card.
     */
    template<std::uniform_random_bit_generator G>
    auto random_node_id(G & gen) -> uint64_t {
        auto ret = uint64_t(impl::random_bits(gen, node_id_bits));
        return ret | node_id_multicast_bit;
    }

    BUUID_EXPORTED auto make_node_id(node_id_kind kind = node_id_kind::detect_system) -> uint64_t;
}

#endif
