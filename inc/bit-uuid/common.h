// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_BIT_UUID_COMMON_H_INCLUDED
#define HEADER_BIT_UUID_COMMON_H_INCLUDED

// Config macros:
//
// The following macros must be defined identically when using and building this library:
//
// BUUID_MULTITHREADED - auto-detected. Set to 1 to force multi-threaded build and 0 to force single threaded 1
// BUUID_USE_EXCEPTIONS - auto-detected. Set to 1 to force usage of exceptions and 0 to force not using them
// BUUID_SHARED - set to 1 when using/building a shared library version of the library
//
// The following macro should be set when building the library itself but not when using it:
//
// BUUID_BUILDING_BUUID - set 1 if building the library itself.

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cstdio>

#include <concepts>
#include <compare>
#include <array>
#include <bit>
#include <span>
#include <string>
#include <string_view>
#include <optional>
#include <limits>
#include <stdexcept>
#include <type_traits>

#if !defined(BUUID_MULTITHREADED)
    #if defined(_MSC_VER) && !defined(_MT)
        #define BUUID_MULTITHREADED 0
    #elif defined(_LIBCPP_VERSION) && (defined(_LIBCPP_HAS_NO_THREADS) || defined(_LIBCPP_HAS_THREADS) && !_LIBCPP_HAS_THREADS)
        #define BUUID_MULTITHREADED 0
    #elif defined(__GLIBCXX__) && !_GLIBCXX_HAS_GTHREADS
        #define BUUID_MULTITHREADED 0
    #elif !__has_include(<atomic>)
        #define BUUID_MULTITHREADED 0
    #else
        #define BUUID_MULTITHREADED 1
    #endif
#endif

#if !defined(BUUID_USE_EXCEPTIONS)
    #if defined(__GNUC__) && !defined(__EXCEPTIONS)
        #define BUUID_USE_EXCEPTIONS 0
    #elif defined(__clang__) && !defined(__cpp_exceptions)
        #define BUUID_USE_EXCEPTIONS 0
    #elif defined(_MSC_VER) && !_HAS_EXCEPTIONS
        #define BUUID_USE_EXCEPTIONS 0
    #else
        #define BUUID_USE_EXCEPTIONS 1
    #endif
#endif

#if BUUID_SHARED
    #if defined(_WIN32) || defined(_WIN64)
        #if BUUID_BUILDING_BUUID
            #define BUUID_EXPORTED __declspec(dllexport)
        #else
            #define BUUID_EXPORTED __declspec(dllimport)
        #endif
    #elif defined(__GNUC__)
        #define BUUID_EXPORTED [[gnu::visibility("default")]]
    #else
        #define BUUID_EXPORTED
    #endif
#else
    #define BUUID_EXPORTED
#endif

#if !defined(__SIZEOF_INT128__)
    #error "bit-uuid requires a compiler with 128-bit integer support (__int128)"
#endif

//See https://github.com/llvm/llvm-project/issues/77773 for the sad story of how feature test
//macros are useless with libc++
#if (__cpp_lib_format >= 201907L || (defined(_LIBCPP_VERSION) && _LIBCPP_VERSION >= 170000)) && __has_include(<format>)

    #define BUUID_SUPPORTS_STD_FORMAT 1

#endif

#if defined(FMT_VERSION) && FMT_VERSION >= 60000 && defined(FMT_THROW)

    #define BUUID_SUPPORTS_FMT_FORMAT 1

#endif

#if BUUID_SUPPORTS_STD_FORMAT
    #include <format>
#endif

namespace buuid
{
    /// Thrown by uuid::parse() on malformed input
    class bad_uuid_string : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /// Thrown when the underlying cryptographic provider fails
    class crypto_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    namespace impl {

        using uint128_t = unsigned __int128;
        using int128_t = __int128;

        template<class T, size_t Extent>
        std::true_type is_span_helper(std::span<T, Extent> * x);

        std::false_type is_span_helper(...);

        template<class T>
        constexpr bool is_span = decltype(is_span_helper((T *)nullptr))::value;

        template<class T>
        concept byte_like = std::is_standard_layout_v<T> &&
                            sizeof(T) == sizeof(uint8_t) &&
        requires {
            static_cast<T>(uint8_t{});
            static_cast<uint8_t>(T{});
        };

        static_assert(byte_like<char>);
        static_assert(byte_like<unsigned char>);
        static_assert(byte_like<signed char>);
        static_assert(byte_like<std::byte>);

        template<class T>
        concept char_like = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                            std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

        void invalid_constexpr_call(const char *);

        #if BUUID_USE_EXCEPTIONS
            #define BUUID_THROW(x) throw x
        #else
            [[noreturn]] inline void fail(const char* message) {
                fprintf(stderr, "buuid: fatal error: %s", message);
                abort();
            }
            #define BUUID_THROW(x) ::buuid::impl::fail((x).what())
        #endif

        template<std::same_as<size_t> S>
        constexpr size_t hash_combine(S prev, S next) {
            constexpr auto digits = std::numeric_limits<S>::digits;
            static_assert(digits == 64 || digits == 32);

            if constexpr (digits == 64) {
                S x = prev + 0x9e3779b9 + next;
                const S m = 0xe9846af9b1a615d;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 32;
                x *= m;
                x ^= x >> 28;
                return x;
            } else {
                S x = prev + 0x9e3779b9 + next;
                const S m1 = 0x21f0aaad;
                const S m2 = 0x735a2d97;
                x ^= x >> 16;
                x *= m1;
                x ^= x >> 15;
                x *= m2;
                x ^= x >> 15;
                return x;
            }
        }

        /// Reads sizeof(T) bytes as a big-endian integer
        template<impl::byte_like Byte, class T>
        constexpr const Byte * read_bytes(const Byte * bytes, T & val) noexcept {
            T tmp = uint8_t(*bytes++);
            for(unsigned i = 0; i < sizeof(T) - 1; ++i)
                tmp = (tmp << 8) | uint8_t(*bytes++);
            val = tmp;
            return bytes;
        }

        /// Writes val as sizeof(T) big-endian bytes
        template<impl::byte_like Byte, class T>
        constexpr Byte * write_bytes(T val, Byte * bytes) noexcept {
            bytes[sizeof(T) - 1] = Byte(static_cast<uint8_t>(val));
            if constexpr (sizeof(T) > 1) {
                for(unsigned i = 1; i != sizeof(T); ++i) {
                    val >>= 8;
                    bytes[sizeof(T) - i - 1] = Byte(static_cast<uint8_t>(val));
                }
            }
            return bytes + sizeof(T);
        }

        constexpr uint128_t byteswap(uint128_t val) noexcept {
            uint128_t ret = 0;
            for (unsigned i = 0; i < 16; ++i) {
                ret = (ret << 8) | uint8_t(val);
                val >>= 8;
            }
            return ret;
        }

        /// Mask with the low `bits` bits set
        constexpr uint128_t low_bits_mask(unsigned bits) noexcept {
            return bits >= 128 ? ~uint128_t(0) : (uint128_t(1) << bits) - 1;
        }

        template<unsigned Bits>
        requires(Bits > 0 && Bits <= 128)
        struct uint_least_bits {
            using type = std::conditional_t<(Bits <= 8),  uint8_t,
                         std::conditional_t<(Bits <= 16), uint16_t,
                         std::conditional_t<(Bits <= 32), uint32_t,
                         std::conditional_t<(Bits <= 64), uint64_t,
                                                          uint128_t>>>>;
        };

        /// Smallest unsigned integer type that holds `Bits` bits
        template<unsigned Bits>
        using uint_least_bits_t = typename uint_least_bits<Bits>::type;
    }
}

#endif
