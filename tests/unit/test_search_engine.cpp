/*
 * Unit tests for the worker search loop
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include <powpool/crypto/sha256.hpp>
#include <powpool/worker/search_engine.hpp>

#include "test_support.hpp"

using namespace powpool::worker;
using powpool::crypto::sha256;
using powpool::crypto::to_hex;
using powpool::testing::CaptureLogger;

using Bytes = std::vector<std::uint8_t>;

namespace {

struct Collector {
    std::mutex mutex;
    std::vector<std::string> lines;

    SearchEngine::Reporter reporter() {
        return [this](std::string_view line) {
            std::lock_guard<std::mutex> lock(mutex);
            lines.emplace_back(line);
        };
    }
};

std::string hash_of(const Bytes& bytes) {
    return to_hex(sha256(std::string(bytes.begin(), bytes.end())));
}

} // namespace

TEST_SUITE("SHA-256") {
    TEST_CASE("known digests") {
        CHECK(to_hex(sha256("")) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
        CHECK(to_hex(sha256("abc")) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        CHECK(hash_of(Bytes{0x00}) == "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");
    }
}

TEST_SUITE("Nonce Encoding") {
    TEST_CASE("minimal two's complement") {
        CHECK(encode_nonce(0) == Bytes{0x00});
        CHECK(encode_nonce(1) == Bytes{0x01});
        CHECK(encode_nonce(127) == Bytes{0x7f});
        CHECK(encode_nonce(128) == Bytes{0x00, 0x80});
        CHECK(encode_nonce(255) == Bytes{0x00, 0xff});
        CHECK(encode_nonce(256) == Bytes{0x01, 0x00});
        CHECK(encode_nonce(32767) == Bytes{0x7f, 0xff});
        CHECK(encode_nonce(32768) == Bytes{0x00, 0x80, 0x00});
    }

    TEST_CASE("grows beyond 64 bits") {
        Nonce big = Nonce(1) << 64;
        Bytes expected{0x01, 0, 0, 0, 0, 0, 0, 0, 0};
        CHECK(encode_nonce(big) == expected);
    }

    TEST_CASE("candidate is payload then nonce") {
        CHECK(candidate_bytes("ab", 128) == Bytes{'a', 'b', 0x00, 0x80});
        CHECK(candidate_bytes("", 0) == Bytes{0x00});
    }
}

TEST_SUITE("Difficulty Check") {
    TEST_CASE("leading zero characters") {
        CHECK(meets_difficulty("abc", 0));
        CHECK(meets_difficulty("0abc", 1));
        CHECK_FALSE(meets_difficulty("0abc", 2));
        CHECK(meets_difficulty("0000ff", 4));
        CHECK_FALSE(meets_difficulty("000fff", 4));
        CHECK_FALSE(meets_difficulty("00", 3));
    }
}

TEST_SUITE("Search Engine") {
    TEST_CASE("difficulty zero succeeds at the start nonce") {
        CaptureLogger log;
        std::atomic<bool> running{true};
        SearchEngine engine(running, log);
        Collector out;

        auto result = engine.run(SearchTask{"payload", 0, 5, 3}, out.reporter());
        REQUIRE(result.has_value());
        CHECK(result->nonce == 5);
        CHECK(result->nonce_hex == "05");
        CHECK(result->hash_hex == hash_of(candidate_bytes("payload", 5)));
        CHECK_FALSE(running.load());

        REQUIRE(out.lines.size() == 2);
        CHECK(out.lines[0] == "FOUND " + result->hash_hex + " 05");
        CHECK(out.lines[1] == "READY");
    }

    TEST_CASE("found nonce belongs to the assigned class and meets difficulty") {
        CaptureLogger log;
        std::atomic<bool> running{true};
        SearchEngine engine(running, log);
        Collector out;

        auto result = engine.run(SearchTask{"abc", 2, 2, 3}, out.reporter());
        REQUIRE(result.has_value());
        CHECK(result->hash_hex.substr(0, 2) == "00");
        CHECK(Nonce(result->nonce % 3) == 2);
        CHECK(result->hash_hex == hash_of(candidate_bytes("abc", result->nonce)));
        CHECK(result->nonce_hex == to_hex(encode_nonce(result->nonce)));
        CHECK(out.lines.back() == "READY");
    }

    TEST_CASE("cleared flag means no digest at all") {
        CaptureLogger log;
        std::atomic<bool> running{false};
        SearchEngine engine(running, log);
        Collector out;

        auto result = engine.run(SearchTask{"abc", 64, 0, 1}, out.reporter());
        CHECK_FALSE(result.has_value());
        CHECK(engine.digests_computed() == 0);
        CHECK(out.lines == std::vector<std::string>{"READY"});
    }

    TEST_CASE("cooperative stop from another thread") {
        CaptureLogger log;
        std::atomic<bool> running{true};
        SearchEngine engine(running, log);
        Collector out;

        std::thread t([&] { engine.run(SearchTask{"abc", 64, 1, 4}, out.reporter()); });
        while (engine.digests_computed() < 100) std::this_thread::yield();

        auto n = engine.current_nonce();
        CHECK(Nonce(n % 4) == 1);
        running.store(false);
        auto stopped_at = engine.digests_computed();
        t.join();

        CHECK(engine.digests_computed() <= stopped_at + 1);
        CHECK(out.lines == std::vector<std::string>{"READY"});
        CHECK(log.contains("interrupted"));
    }
}
