// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_BIT_UUID_LAYOUTS_H_INCLUDED
#define HEADER_BIT_UUID_LAYOUTS_H_INCLUDED

#include <bit-uuid/uuid.h>
#include <bit-uuid/timestamp.h>
#include <bit-uuid/clock_sequence.h>
#include <bit-uuid/random.h>

#include <variant>


namespace buuid {

    namespace impl {

        constexpr uint128_t mask62 = low_bits_mask(62);

        /**
         * Common part of all RFC 9562 version layouts.
         *
         * Holds the 16 bytes and provides the generic accessors. The
         * version and variant fields are written by set_tags() and
         * checked by from_uuid().
         */
        template<class Derived, uuid::version V>
        class layout_base {
        public:
            static constexpr uuid::version version_tag = V;

            constexpr auto to_uuid() const noexcept -> const uuid &
                { return this->m_value; }
            constexpr operator uuid() const noexcept
                { return this->m_value; }

            constexpr auto to_bytes() const noexcept -> std::array<uint8_t, 16>
                { return this->m_value.bytes; }
            constexpr auto as_bytes() const noexcept -> std::span<const uint8_t, 16>
                { return this->m_value.bytes; }

            constexpr auto to_native() const noexcept -> uint128_t
                { return this->m_value.to_native(); }
            constexpr auto to_big() const noexcept -> uint128_t
                { return this->m_value.to_big(); }
            constexpr auto to_little() const noexcept -> uint128_t
                { return this->m_value.to_little(); }

            template<char_like T = char>
            auto to_string(uuid::format fmt = uuid::lowercase) const -> std::basic_string<T>
                { return this->m_value.template to_string<T>(fmt); }

            constexpr auto get_variant() const noexcept -> uuid::variant
                { return this->m_value.get_variant(); }
            constexpr auto get_version() const noexcept -> uuid::version
                { return V; }

            /// Reads an arbitrary bit field
            constexpr auto get(bit_field field) const noexcept -> uint128_t
                { return read_bits(this->m_value.bytes, field); }

            /// Reinterprets a uuid as this layout if its variant and version match
            static constexpr auto from_uuid(const uuid & val) noexcept -> std::optional<Derived> {
                if (val.get_variant() != uuid::variant::rfc9562)
                    return std::nullopt;
                if (read_bits(val.bytes, uuid::common_fields::version) != uint8_t(V))
                    return std::nullopt;
                Derived ret;
                ret.m_value = val;
                return ret;
            }

            friend constexpr auto operator==(const Derived & lhs, const Derived & rhs) noexcept -> bool
                { return lhs.to_uuid() == rhs.to_uuid(); }
            friend constexpr auto operator<=>(const Derived & lhs, const Derived & rhs) noexcept -> std::strong_ordering
                { return lhs.to_uuid() <=> rhs.to_uuid(); }

            template<char_like T>
            friend std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, const Derived & val)
                { return str << val.to_uuid(); }

        protected:
            constexpr layout_base() noexcept = default;

            constexpr void set(bit_field field, uint128_t value) noexcept
                { write_bits(this->m_value.bytes, field, value); }

            constexpr void set_tags() noexcept {
                this->set(uuid::common_fields::version, uint8_t(V));
                this->set(uuid::common_fields::variant, 0b10);
            }

            uuid m_value;
        };
    }

    /// The Nil UUID, all bits zero
    class uuid_nil {
    public:
        constexpr auto to_uuid() const noexcept -> uuid
            { return uuid(); }
        constexpr operator uuid() const noexcept
            { return uuid(); }
        constexpr auto get_version() const noexcept -> uuid::version
            { return uuid::version::nil; }

        friend constexpr auto operator==(const uuid_nil &, const uuid_nil &) noexcept -> bool = default;
        friend constexpr auto operator<=>(const uuid_nil &, const uuid_nil &) noexcept -> std::strong_ordering = default;
    };

    /// The Max UUID, all bits one
    class uuid_max {
    public:
        constexpr auto to_uuid() const noexcept -> uuid
            { return uuid::max(); }
        constexpr operator uuid() const noexcept
            { return uuid::max(); }
        constexpr auto get_version() const noexcept -> uuid::version
            { return uuid::version::max; }

        friend constexpr auto operator==(const uuid_max &, const uuid_max &) noexcept -> bool = default;
        friend constexpr auto operator<=>(const uuid_max &, const uuid_max &) noexcept -> std::strong_ordering = default;
    };

    /**
     * Version 1: Gregorian time-based UUID
     *
     * The 60-bit timestamp is stored low part first.
     */
    class uuid_v1 : public impl::layout_base<uuid_v1, uuid::version::time_based> {
        friend layout_base;
    public:
        struct fields {
            static constexpr auto table = make_bit_layout({32, 16, 4, 12, 2, 14, 48});

            static constexpr bit_field time_low     = table[0];
            static constexpr bit_field time_mid     = table[1];
            static constexpr bit_field version      = table[2];
            static constexpr bit_field time_high    = table[3];
            static constexpr bit_field variant      = table[4];
            static constexpr bit_field clock_seq    = table[5];
            static constexpr bit_field node         = table[6];
        };

        constexpr uuid_v1(gregorian_timestamp ts, uint64_t node) noexcept {
            const impl::uint128_t tick = ts.tick;
            this->set(fields::time_low, tick);
            this->set(fields::time_mid, tick >> 32);
            this->set(fields::time_high, tick >> 48);
            this->set(fields::clock_seq, ts.seq);
            this->set(fields::node, node);
            this->set_tags();
        }

        /// Creates a UUID for the current time obtained from `seq`
        template<clock_sequence_of<gregorian_timestamp> Seq>
        static auto now(Seq & seq, uint64_t node) -> uuid_v1
            { return uuid_v1(seq.next(), node); }

        constexpr auto time_low() const noexcept -> uint32_t
            { return uint32_t(this->get(fields::time_low)); }
        constexpr auto time_mid() const noexcept -> uint16_t
            { return uint16_t(this->get(fields::time_mid)); }
        constexpr auto time_high() const noexcept -> uint16_t
            { return uint16_t(this->get(fields::time_high)); }
        constexpr auto clock_seq() const noexcept -> uint16_t
            { return uint16_t(this->get(fields::clock_seq)); }
        constexpr auto node() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::node)); }

        /// 60-bit count of 100ns intervals since 1582-10-15
        constexpr auto time() const noexcept -> uint64_t
            { return uint64_t(this->time_low()) | (uint64_t(this->time_mid()) << 32) | (uint64_t(this->time_high()) << 48); }

        constexpr auto timestamp() const noexcept -> gregorian_timestamp
            { return {this->time(), this->clock_seq()}; }

    private:
        constexpr uuid_v1() noexcept = default;
    };

    /**
     * Version 2: DCE Security UUID
     *
     * RFC 9562 does not define the contents. Only decoding is supported.
     */
    class uuid_v2 : public impl::layout_base<uuid_v2, uuid::version::dce_security> {
        friend layout_base;
    public:
        struct fields {
            static constexpr auto table = make_bit_layout({48, 4, 12, 2, 62});

            static constexpr bit_field high     = table[0];
            static constexpr bit_field version  = table[1];
            static constexpr bit_field mid      = table[2];
            static constexpr bit_field variant  = table[3];
            static constexpr bit_field low      = table[4];
        };

        constexpr auto high() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::high)); }
        constexpr auto mid() const noexcept -> uint16_t
            { return uint16_t(this->get(fields::mid)); }
        constexpr auto low() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::low)); }

    private:
        constexpr uuid_v2() noexcept = default;
    };

    /// Version 3: name-based UUID using MD5
    class uuid_v3 : public impl::layout_base<uuid_v3, uuid::version::name_based_md5> {
        friend layout_base;
    public:
        struct fields {
            static constexpr auto table = make_bit_layout({48, 4, 12, 2, 62});

            static constexpr bit_field md5_high = table[0];
            static constexpr bit_field version  = table[1];
            static constexpr bit_field md5_mid  = table[2];
            static constexpr bit_field variant  = table[3];
            static constexpr bit_field md5_low  = table[4];
        };

        /// Hashes the namespace bytes followed by `name`. Throws crypto_error if the digest fails
        BUUID_EXPORTED uuid_v3(const uuid & ns, std::span<const uint8_t> name);

        uuid_v3(const uuid & ns, std::string_view name):
            uuid_v3(ns, std::span{reinterpret_cast<const uint8_t *>(name.data()), name.size()})
        {}

        constexpr auto md5_high() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::md5_high)); }
        constexpr auto md5_mid() const noexcept -> uint16_t
            { return uint16_t(this->get(fields::md5_mid)); }
        constexpr auto md5_low() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::md5_low)); }

        /// The 122 bits of the digest that survive in the UUID
        constexpr auto md5() const noexcept -> impl::uint128_t
            { return (impl::uint128_t(this->md5_high()) << 74) | (impl::uint128_t(this->md5_mid()) << 62) | this->md5_low(); }

    private:
        constexpr uuid_v3() noexcept = default;
    };

    /// Version 4: random UUID
    class uuid_v4 : public impl::layout_base<uuid_v4, uuid::version::random> {
        friend layout_base;
    public:
        struct fields {
            static constexpr auto table = make_bit_layout({48, 4, 12, 2, 62});

            static constexpr bit_field random_a = table[0];
            static constexpr bit_field version  = table[1];
            static constexpr bit_field random_b = table[2];
            static constexpr bit_field variant  = table[3];
            static constexpr bit_field random_c = table[4];
        };

        /// Draws all 122 free bits from `gen`
        template<std::uniform_random_bit_generator G>
        explicit uuid_v4(G & gen) {
            this->set(fields::random_a, impl::random_bits(gen, fields::random_a.width));
            this->set(fields::random_b, impl::random_bits(gen, fields::random_b.width));
            this->set(fields::random_c, impl::random_bits(gen, fields::random_c.width));
            this->set_tags();
        }

        /// Creates a random UUID using a freshly seeded random_generator
        static auto generate() -> uuid_v4 {
            random_generator gen;
            return uuid_v4(gen);
        }

        constexpr auto random_a() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::random_a)); }
        constexpr auto random_b() const noexcept -> uint16_t
            { return uint16_t(this->get(fields::random_b)); }
        constexpr auto random_c() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::random_c)); }

        constexpr auto random() const noexcept -> impl::uint128_t
            { return (impl::uint128_t(this->random_a()) << 74) | (impl::uint128_t(this->random_b()) << 62) | this->random_c(); }

    private:
        constexpr uuid_v4() noexcept = default;
    };

    /// Version 5: name-based UUID using SHA-1
    class uuid_v5 : public impl::layout_base<uuid_v5, uuid::version::name_based_sha1> {
        friend layout_base;
    public:
        struct fields {
            static constexpr auto table = make_bit_layout({48, 4, 12, 2, 62});

            static constexpr bit_field sha1_high    = table[0];
            static constexpr bit_field version      = table[1];
            static constexpr bit_field sha1_mid     = table[2];
            static constexpr bit_field variant      = table[3];
            static constexpr bit_field sha1_low     = table[4];
        };

        /// Hashes the namespace bytes followed by `name`. Throws crypto_error if the digest fails
        BUUID_EXPORTED uuid_v5(const uuid & ns, std::span<const uint8_t> name);

        uuid_v5(const uuid & ns, std::string_view name):
            uuid_v5(ns, std::span{reinterpret_cast<const uint8_t *>(name.data()), name.size()})
        {}

        constexpr auto sha1_high() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::sha1_high)); }
        constexpr auto sha1_mid() const noexcept -> uint16_t
            { return uint16_t(this->get(fields::sha1_mid)); }
        constexpr auto sha1_low() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::sha1_low)); }

        constexpr auto sha1() const noexcept -> impl::uint128_t
            { return (impl::uint128_t(this->sha1_high()) << 74) | (impl::uint128_t(this->sha1_mid()) << 62) | this->sha1_low(); }

    private:
        constexpr uuid_v5() noexcept = default;
    };

    /**
     * Version 6: reordered Gregorian time-based UUID
     *
     * Same information as version 1 with the timestamp stored high part
     * first so that byte order matches time order.
     */
    class uuid_v6 : public impl::layout_base<uuid_v6, uuid::version::reordered_time_based> {
        friend layout_base;
    public:
        struct fields {
            static constexpr auto table = make_bit_layout({32, 16, 4, 12, 2, 14, 48});

            static constexpr bit_field time_high    = table[0];
            static constexpr bit_field time_mid     = table[1];
            static constexpr bit_field version      = table[2];
            static constexpr bit_field time_low     = table[3];
            static constexpr bit_field variant      = table[4];
            static constexpr bit_field clock_seq    = table[5];
            static constexpr bit_field node         = table[6];
        };

        constexpr uuid_v6(gregorian_timestamp ts, uint64_t node) noexcept {
            const impl::uint128_t tick = ts.tick;
            this->set(fields::time_high, tick >> 28);
            this->set(fields::time_mid, tick >> 12);
            this->set(fields::time_low, tick);
            this->set(fields::clock_seq, ts.seq);
            this->set(fields::node, node);
            this->set_tags();
        }

        template<clock_sequence_of<gregorian_timestamp> Seq>
        static auto now(Seq & seq, uint64_t node) -> uuid_v6
            { return uuid_v6(seq.next(), node); }

        constexpr auto time_high() const noexcept -> uint32_t
            { return uint32_t(this->get(fields::time_high)); }
        constexpr auto time_mid() const noexcept -> uint16_t
            { return uint16_t(this->get(fields::time_mid)); }
        constexpr auto time_low() const noexcept -> uint16_t
            { return uint16_t(this->get(fields::time_low)); }
        constexpr auto clock_seq() const noexcept -> uint16_t
            { return uint16_t(this->get(fields::clock_seq)); }
        constexpr auto node() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::node)); }

        constexpr auto time() const noexcept -> uint64_t
            { return (uint64_t(this->time_high()) << 28) | (uint64_t(this->time_mid()) << 12) | this->time_low(); }

        constexpr auto timestamp() const noexcept -> gregorian_timestamp
            { return {this->time(), this->clock_seq()}; }

    private:
        constexpr uuid_v6() noexcept = default;
    };

    /**
     * Version 7: Unix epoch time-based UUID
     *
     * The 74 bits following the millisecond timestamp carry the sequence
     * of the unix_ms_timestamp, so ordering of the values produced by one
     * clock sequence matches ordering of the UUIDs.
     */
    class uuid_v7 : public impl::layout_base<uuid_v7, uuid::version::unix_time_based> {
        friend layout_base;
    public:
        struct fields {
            static constexpr auto table = make_bit_layout({48, 4, 12, 2, 62});

            static constexpr bit_field unix_ts_ms   = table[0];
            static constexpr bit_field version      = table[1];
            static constexpr bit_field rand_a       = table[2];
            static constexpr bit_field variant      = table[3];
            static constexpr bit_field rand_b       = table[4];
        };

        constexpr explicit uuid_v7(unix_ms_timestamp ts) noexcept {
            this->set(fields::unix_ts_ms, ts.tick);
            this->set(fields::rand_a, ts.seq >> 62);
            this->set(fields::rand_b, ts.seq & impl::mask62);
            this->set_tags();
        }

        template<clock_sequence_of<unix_ms_timestamp> Seq>
        static auto now(Seq & seq) -> uuid_v7
            { return uuid_v7(seq.next()); }

        constexpr auto unix_ts_ms() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::unix_ts_ms)); }
        constexpr auto rand_a() const noexcept -> uint16_t
            { return uint16_t(this->get(fields::rand_a)); }
        constexpr auto rand_b() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::rand_b)); }

        /// The 74-bit sequence
        constexpr auto sequence() const noexcept -> impl::uint128_t
            { return (impl::uint128_t(this->rand_a()) << 62) | this->rand_b(); }

        constexpr auto timestamp() const noexcept -> unix_ms_timestamp
            { return {this->unix_ts_ms(), this->sequence()}; }

    private:
        constexpr uuid_v7() noexcept = default;
    };

    /// Version 8: application defined 122-bit payload
    class uuid_v8 : public impl::layout_base<uuid_v8, uuid::version::custom> {
        friend layout_base;
    public:
        struct fields {
            static constexpr auto table = make_bit_layout({48, 4, 12, 2, 62});

            static constexpr bit_field custom_a = table[0];
            static constexpr bit_field version  = table[1];
            static constexpr bit_field custom_b = table[2];
            static constexpr bit_field variant  = table[3];
            static constexpr bit_field custom_c = table[4];
        };

        static constexpr unsigned payload_bits = 122;

        /// Stores the low 122 bits of `payload`
        constexpr explicit uuid_v8(impl::uint128_t payload) noexcept {
            this->set(fields::custom_a, payload >> 74);
            this->set(fields::custom_b, payload >> 62);
            this->set(fields::custom_c, payload & impl::mask62);
            this->set_tags();
        }

        constexpr auto custom_a() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::custom_a)); }
        constexpr auto custom_b() const noexcept -> uint16_t
            { return uint16_t(this->get(fields::custom_b)); }
        constexpr auto custom_c() const noexcept -> uint64_t
            { return uint64_t(this->get(fields::custom_c)); }

        constexpr auto custom() const noexcept -> impl::uint128_t
            { return (impl::uint128_t(this->custom_a()) << 74) | (impl::uint128_t(this->custom_b()) << 62) | this->custom_c(); }

    private:
        constexpr uuid_v8() noexcept = default;
    };

    /// Any valid UUID decoded according to its version
    using uuid_layout = std::variant<uuid_nil, uuid_v1, uuid_v2, uuid_v3, uuid_v4,
                                     uuid_v5, uuid_v6, uuid_v7, uuid_v8, uuid_max>;

    /**
     * Decodes `val` into the layout selected by its version
     *
     * Returns std::nullopt for values that are not Nil, Max or an RFC 9562
     * UUID of versions 1 to 8.
     */
    constexpr auto get_layout(const uuid & val) noexcept -> std::optional<uuid_layout> {
        auto ver = val.get_version();
        if (!ver)
            return std::nullopt;
        switch(*ver) {
            case uuid::version::nil:                    return uuid_layout{uuid_nil{}};
            case uuid::version::time_based:             return uuid_layout{*uuid_v1::from_uuid(val)};
            case uuid::version::dce_security:           return uuid_layout{*uuid_v2::from_uuid(val)};
            case uuid::version::name_based_md5:         return uuid_layout{*uuid_v3::from_uuid(val)};
            case uuid::version::random:                 return uuid_layout{*uuid_v4::from_uuid(val)};
            case uuid::version::name_based_sha1:        return uuid_layout{*uuid_v5::from_uuid(val)};
            case uuid::version::reordered_time_based:   return uuid_layout{*uuid_v6::from_uuid(val)};
            case uuid::version::unix_time_based:        return uuid_layout{*uuid_v7::from_uuid(val)};
            case uuid::version::custom:                 return uuid_layout{*uuid_v8::from_uuid(val)};
            case uuid::version::max:                    return uuid_layout{uuid_max{}};
        }
        return std::nullopt;
    }
}

#endif
