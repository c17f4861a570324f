/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powpool/crypto/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace powpool {
namespace crypto {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

Sha256Digest Sha256::digest(const std::uint8_t* data, std::size_t len) {
    Sha256Digest out{};
    unsigned int out_len = static_cast<unsigned int>(out.size());

    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA256");
    }
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("Failed to update SHA256");
    }
    if (EVP_DigestFinal_ex(ctx_, out.data(), &out_len) != 1) {
        throw std::runtime_error("Failed to finalize SHA256");
    }
    return out;
}

Sha256Digest sha256(const std::string& data) {
    Sha256 hasher;
    return hasher.digest(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

std::string to_hex(const std::uint8_t* data, std::size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string s;
    s.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        s[2*i]   = hex[(data[i] >> 4) & 0xF];
        s[2*i+1] = hex[data[i] & 0xF];
    }
    return s;
}

} // namespace crypto
} // namespace powpool
