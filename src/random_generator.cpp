// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <bit-uuid/random.h>

#include <openssl/rand.h>
#include <openssl/err.h>

#include <algorithm>
#include <climits>

using namespace buuid;

void random_generator::fill(std::span<std::byte> dest) {
    while (!dest.empty()) {
        int chunk = int(std::min(dest.size(), size_t(INT_MAX)));
        if (RAND_bytes(reinterpret_cast<unsigned char *>(dest.data()), chunk) != 1) {
            char message[256];
            ERR_error_string_n(ERR_get_error(), message, sizeof(message));
            BUUID_THROW(crypto_error(std::string("RAND_bytes failed: ") + message));
        }
        dest = dest.subspan(size_t(chunk));
    }
}
