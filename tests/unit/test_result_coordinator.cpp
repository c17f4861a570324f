/*
 * Unit tests for solution reconciliation
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <memory>
#include <vector>

#include <powpool/coordinator/result_coordinator.hpp>
#include <powpool/protocol/messages.hpp>

#include "test_support.hpp"

using namespace powpool::coordinator;
using powpool::protocol::parse;
using powpool::testing::CaptureLogger;
using powpool::testing::FakeWorkApi;
using powpool::testing::QueueChannel;

namespace {

struct Fixture {
    CaptureLogger log;
    FakeWorkApi api;
    TaskBoard board;
    WorkerRegistry registry{log};
    ResultCoordinator results{registry, api, board, log};
    std::vector<std::shared_ptr<QueueChannel>> channels;

    Fixture() {
        for (int i = 0; i < 3; ++i) {
            channels.push_back(std::make_shared<QueueChannel>("w" + std::to_string(i) + ":1"));
            registry.add(channels.back());
        }
        board.set(MiningTask{4, "payload", 3});
    }

    bool all_cancelled() const {
        for (auto& ch : channels) {
            if (ch->written() != std::vector<std::string>{"CANCELLED"}) return false;
        }
        return true;
    }

    bool none_written() const {
        for (auto& ch : channels) {
            if (!ch->written().empty()) return false;
        }
        return true;
    }
};

} // namespace

TEST_SUITE("Result Coordinator") {
    TEST_CASE("accepted solution cancels every worker") {
        Fixture f;
        CHECK(f.results.on_found(parse("FOUND 0000abcd 2a"), "w1:1") == FoundOutcome::Accepted);
        REQUIRE(f.api.validated.size() == 1);
        CHECK(f.api.validated[0].difficulty == 4);
        CHECK(f.api.validated[0].nonce == "2a");
        CHECK(f.api.validated[0].hash == "0000abcd");
        CHECK_FALSE(f.board.active());
        CHECK(f.all_cancelled());
    }

    TEST_CASE("only the first accepted report counts") {
        Fixture f;
        CHECK(f.results.on_found(parse("FOUND 0000aa 01"), "w0:1") == FoundOutcome::Accepted);
        CHECK(f.results.on_found(parse("FOUND 0000bb 02"), "w1:1") == FoundOutcome::NoActiveTask);
        CHECK(f.api.validated.size() == 1);
        CHECK(f.all_cancelled());
    }

    TEST_CASE("rejected solution leaves the task running") {
        Fixture f;
        f.api.accept = false;
        CHECK(f.results.on_found(parse("FOUND 0000abcd 2a"), "w1:1") == FoundOutcome::Rejected);
        CHECK(f.board.active());
        CHECK(f.none_written());
    }

    TEST_CASE("validation failure leaves the task running") {
        Fixture f;
        f.api.fail_validate = true;
        CHECK(f.results.on_found(parse("FOUND 0000abcd 2a"), "w1:1") == FoundOutcome::ApiFailure);
        CHECK(f.board.active());
        CHECK(f.none_written());
        CHECK(f.log.contains("Failed to validate"));
    }

    TEST_CASE("malformed report is ignored") {
        Fixture f;
        CHECK(f.results.on_found(parse("FOUND 0000abcd"), "w1:1") == FoundOutcome::Malformed);
        CHECK(f.api.validated.empty());
        CHECK(f.board.active());
    }

    TEST_CASE("no active task") {
        Fixture f;
        f.board.clear();
        CHECK(f.results.on_found(parse("FOUND 0000abcd 2a"), "w1:1") == FoundOutcome::NoActiveTask);
        CHECK(f.api.validated.empty());
        CHECK(f.none_written());
    }

    TEST_CASE("cancel_all clears and broadcasts") {
        Fixture f;
        CHECK(f.results.cancel_all() == 3);
        CHECK_FALSE(f.board.active());
        CHECK(f.all_cancelled());
    }
}
