/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace powpool {
namespace crypto {

using Sha256Digest = std::array<std::uint8_t, 32>;

/**
 * Reusable SHA-256 context. One instance per thread; the search loop keeps
 * one alive for the whole task instead of allocating per digest.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    Sha256Digest digest(const std::uint8_t* data, std::size_t len);
    Sha256Digest digest(const std::vector<std::uint8_t>& data) { return digest(data.data(), data.size()); }

private:
    EVP_MD_CTX* ctx_;
};

/**
 * One-shot SHA-256
 * @param data Input string to hash (raw bytes)
 * @return 32-byte hash output
 */
Sha256Digest sha256(const std::string& data);

// Lowercase hex, two characters per byte.
std::string to_hex(const std::uint8_t* data, std::size_t len);

inline std::string to_hex(const std::vector<std::uint8_t>& bytes) { return to_hex(bytes.data(), bytes.size()); }
inline std::string to_hex(const Sha256Digest& digest) { return to_hex(digest.data(), digest.size()); }

} // namespace crypto
} // namespace powpool
