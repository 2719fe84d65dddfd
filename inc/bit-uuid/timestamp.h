// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_BIT_UUID_TIMESTAMP_H_INCLUDED
#define HEADER_BIT_UUID_TIMESTAMP_H_INCLUDED

#include <bit-uuid/clock.h>


namespace buuid {

    /**
     * A (tick, sequence) pair produced by a clock sequence.
     *
     * @tparam TickBits width of the tick counter
     * @tparam SeqBits width of the sequence counter
     * @tparam NsPerTick length of one tick in nanoseconds
     * @tparam UnixOffsetTicks number of ticks between the timestamp epoch and the Unix epoch
     */
    template<unsigned TickBits, unsigned SeqBits, uint64_t NsPerTick, uint64_t UnixOffsetTicks = 0>
    requires(TickBits > 0 && SeqBits > 0 && TickBits + SeqBits <= 128 && NsPerTick > 0)
    struct basic_timestamp {
        using tick_type = impl::uint_least_bits_t<TickBits>;
        using seq_type = impl::uint_least_bits_t<SeqBits>;

        static constexpr unsigned tick_bits = TickBits;
        static constexpr unsigned seq_bits = SeqBits;
        static constexpr uint64_t ns_per_tick = NsPerTick;
        static constexpr uint64_t unix_offset_ticks = UnixOffsetTicks;

        static constexpr tick_type max_tick = tick_type(impl::low_bits_mask(TickBits));
        static constexpr seq_type max_seq = seq_type(impl::low_bits_mask(SeqBits));

        tick_type tick = 0;
        seq_type seq = 0;

        /**
         * Converts a clock reading to a tick count.
         *
         * Division rounds towards negative infinity. Times before the
         * timestamp epoch map to tick 0 and the result wraps at TickBits.
         */
        static constexpr auto tick_from(clock_source::time_point tp) noexcept -> tick_type {
            impl::int128_t nanos = tp.time_since_epoch().count();
            impl::int128_t ticks = nanos / impl::int128_t(NsPerTick);
            if (nanos % impl::int128_t(NsPerTick) < 0)
                --ticks;
            ticks += impl::int128_t(UnixOffsetTicks);
            if (ticks < 0)
                return 0;
            return tick_type(impl::uint128_t(ticks) & impl::low_bits_mask(TickBits));
        }

        friend constexpr auto operator==(const basic_timestamp & lhs, const basic_timestamp & rhs) noexcept -> bool {
            return lhs.tick == rhs.tick && lhs.seq == rhs.seq;
        }
        friend constexpr auto operator<=>(const basic_timestamp & lhs, const basic_timestamp & rhs) noexcept -> std::strong_ordering {
            if (lhs.tick != rhs.tick)
                return lhs.tick < rhs.tick ? std::strong_ordering::less : std::strong_ordering::greater;
            if (lhs.seq != rhs.seq)
                return lhs.seq < rhs.seq ? std::strong_ordering::less : std::strong_ordering::greater;
            return std::strong_ordering::equal;
        }
    };

    /// 60-bit count of 100ns intervals since 1582-10-15 with a 14-bit clock sequence (versions 1 and 6)
    using gregorian_timestamp = basic_timestamp<60, 14, 100, 0x01B2'1DD2'1381'4000>;

    /// 48-bit count of milliseconds since the Unix epoch with 74 bits of monotonic sequence (version 7)
    using unix_ms_timestamp = basic_timestamp<48, 74, 1'000'000>;

    template<class T>
    concept timestamp_like = requires {
        T::tick_bits;
        T::seq_bits;
        T::max_tick;
        T::max_seq;
    } && requires(T ts, clock_source::time_point tp) {
        { T::tick_from(tp) } -> std::same_as<typename T::tick_type>;
        ts.tick;
        ts.seq;
    };

    static_assert(timestamp_like<gregorian_timestamp>);
    static_assert(timestamp_like<unix_ms_timestamp>);
}

#endif
