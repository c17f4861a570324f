/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <powpool/worker/search_engine.hpp>

#include <iterator>

#include <fmt/format.h>

#include <powpool/crypto/sha256.hpp>
#include <powpool/protocol/messages.hpp>

namespace powpool::worker {

std::vector<std::uint8_t> encode_nonce(const Nonce& nonce) {
    std::vector<std::uint8_t> out;
    if (nonce.is_zero()) {
        out.push_back(0x00);
        return out;
    }
    boost::multiprecision::export_bits(nonce, std::back_inserter(out), 8, true);
    if (out.front() & 0x80) out.insert(out.begin(), 0x00);
    return out;
}

bool meets_difficulty(std::string_view hex_digest, int difficulty) {
    if (difficulty <= 0) return true;
    if (static_cast<std::size_t>(difficulty) > hex_digest.size()) return false;
    for (int i = 0; i < difficulty; ++i) {
        if (hex_digest[static_cast<std::size_t>(i)] != '0') return false;
    }
    return true;
}

std::vector<std::uint8_t> candidate_bytes(std::string_view payload, const Nonce& nonce) {
    std::vector<std::uint8_t> out(payload.begin(), payload.end());
    auto encoded = encode_nonce(nonce);
    out.insert(out.end(), encoded.begin(), encoded.end());
    return out;
}

Nonce SearchEngine::current_nonce() const {
    Nonce n = start_.load();
    n += Nonce(iterations_.load()) * step_.load();
    return n;
}

void SearchEngine::prepare(const SearchTask& task) {
    iterations_.store(0);
    start_.store(task.start);
    step_.store(task.step);
}

std::optional<SearchResult> SearchEngine::run(const SearchTask& task, const Reporter& report) {
    prepare(task);
    log_.info(fmt::format("Mining started: difficulty {}, nonces {} + k*{}", task.difficulty, task.start, task.step));

    std::optional<SearchResult> result;
    try {
        crypto::Sha256 hasher;
        Nonce nonce = task.start;
        const Nonce step = task.step;
        std::vector<std::uint8_t> buffer(task.payload.begin(), task.payload.end());
        const auto prefix_len = buffer.size();

        while (running_.load()) {
            auto encoded = encode_nonce(nonce);
            buffer.resize(prefix_len);
            buffer.insert(buffer.end(), encoded.begin(), encoded.end());

            auto hex = crypto::to_hex(hasher.digest(buffer));
            if (meets_difficulty(hex, task.difficulty)) {
                running_.store(false);
                result = SearchResult{hex, crypto::to_hex(encoded), nonce};
                break;
            }
            nonce += step;
            iterations_.fetch_add(1);
        }
    } catch (const std::exception& e) {
        running_.store(false);
        log_.error(fmt::format("Mining aborted: {}", e.what()));
    }

    if (result) {
        log_.info(fmt::format("Mining completed: nonce {} gives {}", result->nonce.str(), result->hash_hex));
        report(protocol::build_found(result->hash_hex, result->nonce_hex));
    } else {
        log_.info(fmt::format("Mining interrupted after {} digests", iterations_.load()));
    }
    report(protocol::verb::kReady);
    return result;
}

} // namespace powpool::worker
