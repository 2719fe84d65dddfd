// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_BIT_UUID_RANDOM_H_INCLUDED
#define HEADER_BIT_UUID_RANDOM_H_INCLUDED

#include <bit-uuid/common.h>

#include <random>


namespace buuid {

    /**
     * Cryptographically secure uniform random bit generator.
     *
     * Draws from the OpenSSL DRBG in blocks. An instance is not safe to use
     * from multiple threads concurrently; give each thread its own.
     * Failure of the underlying provider is reported as crypto_error.
     */
    class BUUID_EXPORTED random_generator {
    public:
        using result_type = uint64_t;

        random_generator() = default;
        random_generator(const random_generator &) = delete;
        random_generator & operator=(const random_generator &) = delete;

        static constexpr auto min() noexcept -> result_type
            { return 0; }
        static constexpr auto max() noexcept -> result_type
            { return std::numeric_limits<result_type>::max(); }

        auto operator()() -> result_type {
            if (this->m_pos == m_buffer.size()) {
                fill(std::as_writable_bytes(std::span{this->m_buffer}));
                this->m_pos = 0;
            }
            return this->m_buffer[this->m_pos++];
        }

        /// Fills `dest` with random bytes directly from the provider
        static void fill(std::span<std::byte> dest);

    private:
        std::array<result_type, 32> m_buffer{};
        size_t m_pos = m_buffer.size();
    };

    static_assert(std::uniform_random_bit_generator<random_generator>);

    namespace impl {

        /// Draws a uniformly distributed value with `bits` random low bits
        template<std::uniform_random_bit_generator G>
        auto random_bits(G & gen, unsigned bits) -> uint128_t {
            std::uniform_int_distribution<uint64_t> distrib;
            uint128_t ret = 0;
            for (unsigned drawn = 0; drawn < bits; drawn += 64)
                ret = (ret << 64) | distrib(gen);
            return ret & low_bits_mask(bits);
        }

        /// Draws a uniformly distributed value in [lo, hi]
        template<std::uniform_random_bit_generator G>
        auto random_between(G & gen, uint64_t lo, uint64_t hi) -> uint64_t {
            std::uniform_int_distribution<uint64_t> distrib(lo, hi);
            return distrib(gen);
        }
    }
}

#endif
