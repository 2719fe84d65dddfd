// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <bit-uuid/layouts.h>

#include <openssl/evp.h>
#include <openssl/err.h>

#include <memory>

using namespace buuid;

namespace {

    using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    [[noreturn]] void throw_crypto_error(const char * what) {
        char message[256];
        ERR_error_string_n(ERR_get_error(), message, sizeof(message));
        BUUID_THROW(crypto_error(std::string(what) + ": " + message));
    }

    /**
     * Computes digest(ns bytes || name) and returns its first 16 bytes
     * as a big-endian integer
     */
    auto name_digest(const EVP_MD * md, const uuid & ns, std::span<const uint8_t> name) -> impl::uint128_t {

        md_ctx_ptr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx)
            throw_crypto_error("EVP_MD_CTX_new failed");

        if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1)
            throw_crypto_error("EVP_DigestInit_ex failed");
        if (EVP_DigestUpdate(ctx.get(), ns.bytes.data(), ns.bytes.size()) != 1)
            throw_crypto_error("EVP_DigestUpdate failed");
        if (!name.empty() && EVP_DigestUpdate(ctx.get(), name.data(), name.size()) != 1)
            throw_crypto_error("EVP_DigestUpdate failed");

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned digest_len = 0;
        if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1)
            throw_crypto_error("EVP_DigestFinal_ex failed");
        if (digest_len < 16)
            BUUID_THROW(crypto_error("digest is shorter than 16 bytes"));

        impl::uint128_t ret;
        impl::read_bytes(digest, ret);
        return ret;
    }
}

uuid_v3::uuid_v3(const uuid & ns, std::span<const uint8_t> name) {
    auto hash = name_digest(EVP_md5(), ns, name);
    this->set(fields::md5_high, hash >> 80);
    this->set(fields::md5_mid, hash >> 64);
    this->set(fields::md5_low, hash & impl::mask62);
    this->set_tags();
}

uuid_v5::uuid_v5(const uuid & ns, std::span<const uint8_t> name) {
    auto hash = name_digest(EVP_sha1(), ns, name);
    this->set(fields::sha1_high, hash >> 80);
    this->set(fields::sha1_mid, hash >> 64);
    this->set(fields::sha1_low, hash & impl::mask62);
    this->set_tags();
}
