// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_BIT_UUID_CLOCK_SEQUENCE_H_INCLUDED
#define HEADER_BIT_UUID_CLOCK_SEQUENCE_H_INCLUDED

#include <bit-uuid/timestamp.h>
#include <bit-uuid/random.h>
#include <bit-uuid/threading.h>

#include <algorithm>


namespace buuid {

    /**
     * Thread-safe generator of unique, monotonic timestamps.
     *
     * The last issued (tick, seq) pair is packed into a single 128-bit cell and
     * updated with compare-and-swap. When the clock has moved past the last
     * tick a fresh random sequence in the lower half of the sequence range is
     * chosen. Otherwise the sequence is bumped by a random step. If that would
     * overflow the sequence width the call spins until the clock advances.
     *
     * Every pair returned by one instance is unique and all of them can be
     * arranged in a single strictly increasing order consistent with the
     * order each thread observed.
     */
    template<timestamp_like Timestamp>
    class safe_clock_sequence {
    public:
        using timestamp = Timestamp;

        explicit safe_clock_sequence(const clock_source & clock = clock_source::system()) noexcept:
            m_clock(clock)
        {}
        safe_clock_sequence(const safe_clock_sequence &) = delete;
        safe_clock_sequence & operator=(const safe_clock_sequence &) = delete;

        /// Returns the next timestamp using `gen` for sequence randomization
        template<std::uniform_random_bit_generator G>
        auto next(G & gen) -> Timestamp {
            for ( ; ; ) {
                auto tick = Timestamp::tick_from(this->m_clock.now());
                auto old_state = this->m_state.load();

                auto last_tick = unpack_tick(old_state);
                impl::uint128_t seq;
                if (tick > last_tick) {
                    last_tick = tick;
                    seq = impl::random_bits(gen, Timestamp::seq_bits - 1);
                } else {
                    seq = unpack_seq(old_state);
                    auto step = impl::random_between(gen, 1, max_step);
                    if (seq > impl::uint128_t(Timestamp::max_seq) - step)
                        continue;
                    seq += step;
                }

                auto new_state = pack(last_tick, seq);
                if (this->m_state.compare_exchange_weak(old_state, new_state))
                    return Timestamp{last_tick, typename Timestamp::seq_type(seq)};
            }
        }

        /// Returns the next timestamp using a freshly seeded random_generator
        ///
        /// Every call refills a new generator from the system CSPRNG. On hot paths
        /// keep a generator around and call next(gen) instead.
        auto next() -> Timestamp {
            random_generator gen;
            return this->next(gen);
        }

    private:
        static constexpr uint64_t max_step = (Timestamp::max_seq >> 4) > 0xFFFF ? 0xFFFF :
                                             std::max<uint64_t>(1, uint64_t(Timestamp::max_seq >> 4));

        static constexpr auto pack(typename Timestamp::tick_type tick, impl::uint128_t seq) noexcept -> impl::uint128_t
            { return (impl::uint128_t(tick) << Timestamp::seq_bits) | seq; }
        static constexpr auto unpack_tick(impl::uint128_t state) noexcept -> typename Timestamp::tick_type
            { return typename Timestamp::tick_type(state >> Timestamp::seq_bits); }
        static constexpr auto unpack_seq(impl::uint128_t state) noexcept -> impl::uint128_t
            { return state & impl::low_bits_mask(Timestamp::seq_bits); }

    private:
        const clock_source & m_clock;
        impl::atomic_if_multithreaded<impl::uint128_t> m_state{0};
    };

    /**
     * Single-owner generator of strictly increasing timestamps.
     *
     * Never waits for the clock: when the sequence overflows within a tick the
     * generator borrows the next tick as "debt" and pays it back as the clock
     * catches up. The returned tick can therefore run ahead of the wall clock
     * for as long as issuance outpaces it.
     *
     * An instance must not be used from multiple threads concurrently.
     */
    template<timestamp_like Timestamp>
    class fast_clock_sequence {
    public:
        using timestamp = Timestamp;
        using tick_type = typename Timestamp::tick_type;
        using seq_type = typename Timestamp::seq_type;

        explicit fast_clock_sequence(const clock_source & clock = clock_source::system()) noexcept:
            m_clock(clock)
        {}
        fast_clock_sequence(const fast_clock_sequence &) = delete;
        fast_clock_sequence & operator=(const fast_clock_sequence &) = delete;

        auto next() noexcept -> Timestamp {
            const auto tick = impl::uint128_t(Timestamp::tick_from(this->m_clock.now()));

            if (tick > this->m_last_tick) {
                auto paid = std::min(this->m_debt, tick - this->m_last_tick);
                this->m_debt -= paid;
                this->m_last_tick += paid;
            }

            if (tick > this->m_last_tick + this->m_debt) {
                this->m_last_tick = tick;
                this->m_debt = 0;
                this->m_seq = 0;
            }

            Timestamp ret{
                tick_type((this->m_last_tick + this->m_debt) & impl::low_bits_mask(Timestamp::tick_bits)),
                this->m_seq
            };

            if (this->m_seq == Timestamp::max_seq) {
                this->m_seq = 0;
                ++this->m_debt;
            } else {
                ++this->m_seq;
            }
            return ret;
        }

        auto last_tick() const noexcept -> tick_type
            { return tick_type(this->m_last_tick); }
        auto debt() const noexcept -> impl::uint128_t
            { return this->m_debt; }
        auto sequence() const noexcept -> seq_type
            { return this->m_seq; }

    private:
        const clock_source & m_clock;
        impl::uint128_t m_last_tick = 0;
        impl::uint128_t m_debt = 0;
        seq_type m_seq = 0;
    };

    /// A source of timestamps of a given kind
    template<class Seq, class Timestamp>
    concept clock_sequence_of = requires(Seq & seq) {
        { seq.next() } -> std::same_as<Timestamp>;
    };
}

#endif
