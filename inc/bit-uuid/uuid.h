// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_BIT_UUID_UUID_H_INCLUDED
#define HEADER_BIT_UUID_UUID_H_INCLUDED

#include <bit-uuid/bit_field.h>

#include <algorithm>
#include <istream>
#include <ostream>
#include <iterator>

namespace buuid {
    namespace impl {

        template<char_like C> struct uuid_char_traits {
            static constexpr C l = C(u8'l');
            static constexpr C u = C(u8'u');
            static constexpr C cl_br = C(u8'}');
            static constexpr C dash = C(u8'-');
        };

        template<> struct uuid_char_traits<char> {
            static constexpr char l = 'l';
            static constexpr char u = 'u';
            static constexpr char cl_br = '}';
            static constexpr char dash = '-';
        };

        template<> struct uuid_char_traits<wchar_t> {
            static constexpr wchar_t l = L'l';
            static constexpr wchar_t u = L'u';
            static constexpr wchar_t cl_br = L'}';
            static constexpr wchar_t dash = L'-';
        };

        struct hex_alphabet {
            static constexpr uint8_t invalid = 16;

            template<char_like C>
            static constexpr C encode(bool uppercase, uint8_t nibble) noexcept {
                constexpr const char lower[] = "0123456789abcdef";
                constexpr const char upper[] = "0123456789ABCDEF";
                return C((uppercase ? upper : lower)[nibble]);
            }

            template<char_like C>
            static constexpr uint8_t decode(C c) noexcept {
                if (c >= C(u8'0') && c <= C(u8'9'))
                    return uint8_t(c - C(u8'0'));
                if (c >= C(u8'a') && c <= C(u8'f'))
                    return uint8_t(c - C(u8'a') + 10);
                if (c >= C(u8'A') && c <= C(u8'F'))
                    return uint8_t(c - C(u8'A') + 10);
                return invalid;
            }
        };
    }

    class uuid_nil;
    class uuid_max;
    class uuid_v1;
    class uuid_v2;
    class uuid_v3;
    class uuid_v4;
    class uuid_v5;
    class uuid_v6;
    class uuid_v7;
    class uuid_v8;

    class uuid {
    public:
        /// UUID variant
        /// see https://www.rfc-editor.org/rfc/rfc9562.html#name-variant-field
        enum class variant: uint8_t {
            ncs         = 0,
            rfc9562     = 1,
            microsoft   = 2,
            future      = 3
        };

        /// UUID version
        /// see https://www.rfc-editor.org/rfc/rfc9562.html#name-version-field
        enum class version : uint8_t {
            nil                     = 0,
            time_based              = 1,
            dce_security            = 2,
            name_based_md5          = 3,
            random                  = 4,
            name_based_sha1         = 5,
            reordered_time_based    = 6,
            unix_time_based         = 7,
            custom                  = 8,
            max                     = 15
        };

        /// Whether to print uuid in lower or upper case
        enum format {
            lowercase,
            uppercase
        };

        /// Fields shared by all RFC 9562 layouts
        struct common_fields {
            static constexpr bit_field version{48, 4};
            static constexpr bit_field variant{64, 2};
        };

        struct namespaces;

        static constexpr size_t string_length = 36;

    private:
        template<impl::char_like T>
        static constexpr bool read_hex(const T * str, uint8_t & val) noexcept {
            uint8_t ret = 0;
            for (int i = 0; i < 2; ++i) {
                uint8_t nibble = impl::hex_alphabet::decode(*str++);
                if (nibble == impl::hex_alphabet::invalid)
                    return false;
                ret = uint8_t((ret << 4) | nibble);
            }
            val = ret;
            return true;
        }

        template<impl::char_like T>
        static constexpr void write_hex(uint8_t val, T * str, format fmt) noexcept {
            *str++ = impl::hex_alphabet::encode<T>(fmt == uppercase, uint8_t(val >> 4));
            *str++ = impl::hex_alphabet::encode<T>(fmt == uppercase, uint8_t(val & 0x0F));
        }

        template<impl::char_like T>
        static constexpr bool parse_into(const T * str, uint8_t * dest) noexcept {
            using tr = impl::uuid_char_traits<T>;

            for (size_t pos = 0; pos < string_length; ) {
                if (pos == 8 || pos == 13 || pos == 18 || pos == 23) {
                    if (str[pos] != tr::dash)
                        return false;
                    ++pos;
                    continue;
                }
                if (!uuid::read_hex(str + pos, *dest++))
                    return false;
                pos += 2;
            }
            return true;
        }

    public:
        std::array<uint8_t, 16> bytes{};

    public:
        ///Constructs a Nil UUID
        constexpr uuid() noexcept = default;

        ///Constructs uuid from a string literal
        template<impl::char_like T>
        consteval uuid(const T (&src)[37]) noexcept {
            if (!uuid::parse_into(src, this->bytes.data()) || src[36] != 0)
                impl::invalid_constexpr_call("invalid uuid string");
        }

        /// Constructs uuid from a span of 16 byte-like objects
        template<impl::byte_like Byte>
        constexpr uuid(std::span<Byte, 16> src) noexcept {
            for (size_t i = 0; i < 16; ++i)
                this->bytes[i] = static_cast<uint8_t>(src[i]);
        }

        /// Constructs uuid from anything convertible to a span of 16 byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
            requires decltype(std::span{x})::extent == 16;
        })
        constexpr uuid(const T & src) noexcept:
            uuid{std::span{src}}
        {}

        /// Returns a Max UUID
        static constexpr uuid max() noexcept
            { return uuid("FFFFFFFF-FFFF-FFFF-FFFF-FFFFFFFFFFFF"); }

        /// Constructs uuid from its numeric value (byte 0 is the most significant)
        static constexpr uuid from_native(impl::uint128_t value) noexcept {
            uuid ret;
            impl::write_bytes(value, ret.bytes.data());
            return ret;
        }

        /// Constructs uuid from an integer whose in-memory representation is big-endian
        static constexpr uuid from_big(impl::uint128_t value) noexcept {
            if constexpr (std::endian::native == std::endian::big)
                return from_native(value);
            else
                return from_native(impl::byteswap(value));
        }

        /// Constructs uuid from an integer whose in-memory representation is little-endian
        static constexpr uuid from_little(impl::uint128_t value) noexcept {
            if constexpr (std::endian::native == std::endian::little)
                return from_native(value);
            else
                return from_native(impl::byteswap(value));
        }

        /// Resets the object to a Nil UUID
        constexpr void clear() noexcept {
            *this = uuid();
        }

        /// Returns the numeric value (byte 0 is the most significant)
        constexpr auto to_native() const noexcept -> impl::uint128_t {
            impl::uint128_t ret;
            impl::read_bytes(this->bytes.data(), ret);
            return ret;
        }

        /// Returns an integer whose in-memory representation is the big-endian byte form
        constexpr auto to_big() const noexcept -> impl::uint128_t {
            if constexpr (std::endian::native == std::endian::big)
                return to_native();
            else
                return impl::byteswap(to_native());
        }

        /// Returns an integer whose in-memory representation is the little-endian byte form
        constexpr auto to_little() const noexcept -> impl::uint128_t {
            if constexpr (std::endian::native == std::endian::little)
                return to_native();
            else
                return impl::byteswap(to_native());
        }

        constexpr auto to_bytes() const noexcept -> std::array<uint8_t, 16> {
            return this->bytes;
        }

        constexpr auto as_bytes() const noexcept -> std::span<const uint8_t, 16> {
            return this->bytes;
        }

        constexpr bool is_nil() const noexcept {
            return *this == uuid();
        }

        constexpr bool is_max() const noexcept {
            return *this == uuid::max();
        }

        /// Returns the UUID variant
        ///
        /// The variant is a variable length prefix code in the top bits of byte 8
        constexpr auto get_variant() const noexcept -> variant {
            uint8_t val = this->bytes[8];
            if ((val & 0x80) == 0)
                return variant::ncs;
            if ((val & 0x40) == 0)
                return variant::rfc9562;
            if ((val & 0x20) == 0)
                return variant::microsoft;
            return variant::future;
        }

        /**
         * Returns the UUID version
         *
         * Nil and Max UUIDs report version::nil and version::max. Otherwise
         * the version is only defined for variant::rfc9562 UUIDs with a version
         * field of 1 to 8; std::nullopt is returned for anything else.
         */
        constexpr auto get_version() const noexcept -> std::optional<version> {
            if (this->is_nil())
                return version::nil;
            if (this->is_max())
                return version::max;
            if (this->get_variant() != variant::rfc9562)
                return std::nullopt;
            auto val = uint8_t(read_bits(this->bytes, common_fields::version));
            if (val < 1 || val > 8)
                return std::nullopt;
            return static_cast<version>(val);
        }

        constexpr friend auto operator==(const uuid & lhs, const uuid & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const uuid & lhs, const uuid & rhs) noexcept -> std::strong_ordering = default;

        /// Parses uuid from a span of characters
        ///
        /// The input must be exactly 36 characters long
        template<impl::char_like T, size_t Extent>
        static constexpr std::optional<uuid> from_chars(std::span<const T, Extent> src) noexcept {
            if constexpr (Extent != std::dynamic_extent) {
                static_assert(Extent == string_length, "uuid string must be exactly 36 characters");
            } else {
                if (src.size() != string_length)
                    return std::nullopt;
            }

            uuid ret;
            if (!uuid::parse_into(src.data(), ret.bytes.data()))
                return std::nullopt;
            return ret;
        }

        /// Parses uuid from a string view
        template<impl::char_like T>
        static constexpr std::optional<uuid> from_chars(std::basic_string_view<T> src) noexcept
            { return uuid::from_chars(std::span<const T>(src.data(), src.size())); }

        /// Parses uuid from a string
        template<impl::char_like T>
        static constexpr std::optional<uuid> from_chars(const std::basic_string<T> & src) noexcept
            { return uuid::from_chars(std::basic_string_view<T>(src)); }

        /// Parses uuid from a character array
        ///
        /// A trailing null, if present, is not part of the input. The array is never
        /// read past its end.
        template<impl::char_like T, size_t N>
        static constexpr std::optional<uuid> from_chars(const T (&src)[N]) noexcept
            { return uuid::from_chars(std::basic_string_view<T>(src, (N > 0 && src[N - 1] == T(0)) ? N - 1 : N)); }

        /// Parses uuid from a character array that holds exactly the 36 characters
        template<impl::char_like T>
        static constexpr std::optional<uuid> from_chars(const std::array<T, string_length> & src) noexcept
            { return uuid::from_chars(std::span<const T, string_length>(src)); }

        /// Parses uuid from a string, throwing bad_uuid_string on failure
        static uuid parse(std::string_view src) {
            if (auto ret = uuid::from_chars(src))
                return *ret;
            BUUID_THROW(bad_uuid_string("invalid uuid string"));
        }

        /// Formats uuid into a span of characters
        template<impl::char_like T, size_t Extent>
        [[nodiscard]]
        constexpr auto to_chars(std::span<T, Extent> dest, format fmt = lowercase) const noexcept ->
            std::conditional_t<Extent == std::dynamic_extent, bool, void> {

            if constexpr (Extent == std::dynamic_extent) {
                if (dest.size() < string_length)
                    return false;
            } else {
                static_assert(Extent >= string_length, "destination is too small");
            }

            using tr = impl::uuid_char_traits<T>;

            T * out = dest.data();
            for (size_t i = 0; i < this->bytes.size(); ++i) {
                if (i == 4 || i == 6 || i == 8 || i == 10)
                    *out++ = tr::dash;
                uuid::write_hex(this->bytes[i], out, fmt);
                out += 2;
            }

            if constexpr (Extent == std::dynamic_extent)
                return true;
        }

        /// Formats uuid into anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        })
        [[nodiscard]]
        constexpr auto to_chars(T & dest, format fmt = lowercase) const noexcept {
            return this->to_chars(std::span{dest}, fmt);
        }

        /// Returns a character array with formatted uuid
        template<impl::char_like T = char>
        constexpr auto to_chars(format fmt = lowercase) const noexcept -> std::array<T, string_length> {
            std::array<T, string_length> ret;
            to_chars(ret, fmt);
            return ret;
        }

        template<impl::char_like T = char>
    #if __cpp_lib_constexpr_string >= 201907L
        constexpr
    #endif
        /// Returns a string with formatted uuid
        auto to_string(format fmt = lowercase) const -> std::basic_string<T>
        {
            std::basic_string<T> ret(string_length, T(0));
            (void)to_chars(ret, fmt);
            return ret;
        }

        /// Prints uuid into an ostream
        template<impl::char_like T>
        friend std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, const uuid val) {
            const auto flags = str.flags();
            const uuid::format fmt = (flags & std::ios_base::uppercase ? uuid::uppercase : uuid::lowercase);
            std::array<T, string_length> buf;
            val.to_chars(buf, fmt);
            std::copy(buf.begin(), buf.end(), std::ostreambuf_iterator<T>(str));
            return str;
        }

        /// Reads uuid from an istream
        template<impl::char_like T>
        friend std::basic_istream<T> & operator>>(std::basic_istream<T> & str, uuid & val) {
            std::array<T, string_length> buf;
            auto * strbuf = str.rdbuf();
            for(T & c: buf) {
                auto res = strbuf->sbumpc();
                if (res == std::char_traits<T>::eof()) {
                    str.setstate(std::ios_base::eofbit | std::ios_base::failbit);
                    return str;
                }
                c = T(res);
            }
            if (auto maybe_val = uuid::from_chars(buf))
                val = *maybe_val;
            else
                str.setstate(std::ios_base::failbit);
            return str;
        }

        /// Returns hash code for the uuid
        friend constexpr size_t hash_value(const uuid & val) noexcept {
            static_assert(sizeof(uuid) > sizeof(size_t) && sizeof(uuid) % sizeof(size_t) == 0);
            size_t ret = 0;
            for(unsigned i = 0; i < sizeof(uuid) / sizeof(size_t); ++i) {
                size_t temp;
                impl::read_bytes(val.bytes.data() + i * sizeof(size_t), temp);
                ret = impl::hash_combine(ret, temp);
            }
            return ret;
        }
    };

    static_assert(sizeof(uuid) == 16);

    /// Well-known namespaces for name based UUIDs (versions 3 and 5)
    struct uuid::namespaces {
        /// Name string is a fully-qualified domain name
        static constexpr uuid dns{"6ba7b810-9dad-11d1-80b4-00c04fd430c8"};

        /// Name string is a URL
        static constexpr uuid url{"6ba7b811-9dad-11d1-80b4-00c04fd430c8"};

        /// Name string is an ISO OID
        static constexpr uuid oid{"6ba7b812-9dad-11d1-80b4-00c04fd430c8"};

        /// Name string is an X.500 DN (in DER or a text output format)
        static constexpr uuid x500{"6ba7b814-9dad-11d1-80b4-00c04fd430c8"};

        namespaces() = delete;
        ~namespaces() = delete;
        namespaces(const namespaces &) = delete;
        namespaces & operator=(const namespaces &) = delete;
    };

    namespace impl {
        template<class Derived, class CharT>
        struct formatter_base
        {
            uuid::format fmt = uuid::lowercase;

            template<class ParseContext>
            constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator
            {
                using tr = uuid_char_traits<CharT>;

                auto it = ctx.begin();
                while(it != ctx.end()) {
                    if (*it == tr::l) {
                        this->fmt = uuid::lowercase; ++it;
                    } else if (*it == tr::u) {
                        this->fmt = uuid::uppercase; ++it;
                    } else if (*it == tr::cl_br) {
                        break;
                    } else {
                        static_cast<Derived *>(this)->raise_exception("Invalid format args");
                    }
                }
                return it;
            }

            template <typename FormatContext>
            auto format(uuid val, FormatContext & ctx) const -> decltype(ctx.out())
            {
                std::array<CharT, uuid::string_length> buf;
                val.to_chars(buf, this->fmt);
                return std::copy(buf.begin(), buf.end(), ctx.out());
            }
        };
    }
}

/// std::hash specialization for uuid
template<>
struct std::hash<buuid::uuid> {

    constexpr size_t operator()(const buuid::uuid & val) const noexcept {
        return hash_value(val);
    }
};


#if BUUID_SUPPORTS_STD_FORMAT

/// uuid formatter for std::format
template<class CharT>
struct std::formatter<::buuid::uuid, CharT> : public ::buuid::impl::formatter_base<std::formatter<::buuid::uuid, CharT>, CharT>
{
    [[noreturn]] void raise_exception(const char * message) {
        BUUID_THROW(std::format_error(message));
    }
};

#endif

#if BUUID_SUPPORTS_FMT_FORMAT

/// uuid formatter for fmt::format
template<class CharT>
struct fmt::formatter<::buuid::uuid, CharT> : public ::buuid::impl::formatter_base<fmt::formatter<::buuid::uuid, CharT>, CharT>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif

#endif
