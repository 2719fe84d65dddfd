// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_BIT_UUID_BIT_FIELD_H_INCLUDED
#define HEADER_BIT_UUID_BIT_FIELD_H_INCLUDED

#include <bit-uuid/common.h>


namespace buuid {

    /**
     * A named sub-field of a 128-bit value.
     *
     * Bits are numbered big-endian: offset 0 is the most significant bit
     * of byte 0 and offset 127 the least significant bit of byte 15.
     */
    struct bit_field {
        unsigned offset;
        unsigned width;

        friend constexpr auto operator==(const bit_field &, const bit_field &) noexcept -> bool = default;
    };

    /**
     * Builds a field table from a list of widths in most-significant-first order.
     *
     * The widths must be non-zero and sum to exactly 128 bits. Violations
     * are reported at compile time.
     */
    template<size_t N>
    consteval auto make_bit_layout(const unsigned (&widths)[N]) -> std::array<bit_field, N> {
        std::array<bit_field, N> ret{};
        unsigned offset = 0;
        for (size_t i = 0; i < N; ++i) {
            if (widths[i] == 0 || widths[i] > 128 - offset)
                impl::invalid_constexpr_call("invalid bit field width");
            ret[i] = {offset, widths[i]};
            offset += widths[i];
        }
        if (offset != 128)
            impl::invalid_constexpr_call("bit layout must cover exactly 128 bits");
        return ret;
    }

    /// Reads the value of `field` from a big-endian 16 byte buffer
    constexpr auto read_bits(std::span<const uint8_t, 16> bytes, bit_field field) noexcept -> impl::uint128_t {
        impl::uint128_t val;
        impl::read_bytes(bytes.data(), val);
        return (val >> (128 - field.offset - field.width)) & impl::low_bits_mask(field.width);
    }

    /**
     * Stores the low `field.width` bits of `value` into `field` of a big-endian 16 byte buffer
     *
     * Bits outside of the field are left untouched
     */
    constexpr void write_bits(std::span<uint8_t, 16> bytes, bit_field field, impl::uint128_t value) noexcept {
        const unsigned shift = 128 - field.offset - field.width;
        const impl::uint128_t mask = impl::low_bits_mask(field.width) << shift;

        impl::uint128_t val;
        impl::read_bytes(bytes.data(), val);
        val = (val & ~mask) | ((value << shift) & mask);
        impl::write_bytes(val, bytes.data());
    }
}

#endif
