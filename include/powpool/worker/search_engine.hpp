/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include <powpool/logging/logger.hpp>

namespace powpool::worker {

using Nonce = boost::multiprecision::cpp_int;

struct SearchTask {
    std::string payload;
    int difficulty{0};
    std::uint64_t start{0};
    std::uint64_t step{1};
};

struct SearchResult {
    std::string hash_hex;
    std::string nonce_hex;
    Nonce nonce;
};

/**
 * Minimal big-endian two's-complement encoding of a non-negative nonce.
 * Zero is a single 0x00 byte; a leading 0x00 is added when the top bit of
 * the magnitude is set (0x80 -> 00 80).
 */
std::vector<std::uint8_t> encode_nonce(const Nonce& nonce);

// True iff the first `difficulty` characters of hex_digest are '0'.
bool meets_difficulty(std::string_view hex_digest, int difficulty);

// payload bytes followed by encode_nonce(nonce)
std::vector<std::uint8_t> candidate_bytes(std::string_view payload, const Nonce& nonce);

/**
 * Brute-force search over one congruence class of nonces.
 *
 * The loop checks `running` before each digest, so clearing it stops the
 * search after at most one more digest. A match clears it too. READY is
 * reported whenever the loop exits.
 */
class SearchEngine {
public:
    using Reporter = std::function<void(std::string_view line)>;

    SearchEngine(std::atomic<bool>& running, powpool::logging::Logger& log)
        : running_(running), log_(log) {}

    // Publishes the task's position so current_nonce() is meaningful before run() starts.
    void prepare(const SearchTask& task);

    std::optional<SearchResult> run(const SearchTask& task, const Reporter& report);

    // Nonce currently under test: start + iterations * step.
    Nonce current_nonce() const;
    std::uint64_t digests_computed() const { return iterations_.load(); }

private:
    std::atomic<bool>& running_;
    powpool::logging::Logger& log_;
    std::atomic<std::uint64_t> iterations_{0};
    std::atomic<std::uint64_t> start_{0};
    std::atomic<std::uint64_t> step_{1};
};

} // namespace powpool::worker
