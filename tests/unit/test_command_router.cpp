/*
 * Unit tests for operator console commands
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <memory>
#include <sstream>
#include <vector>

#include <powpool/coordinator/command_router.hpp>

#include "test_support.hpp"

using namespace powpool::coordinator;
using powpool::testing::CaptureLogger;
using powpool::testing::FakeWorkApi;
using powpool::testing::QueueChannel;

namespace {

struct Console {
    CaptureLogger log;
    FakeWorkApi api;
    TaskBoard board;
    WorkerRegistry registry{log};
    WorkDistributor distributor{registry, api, board, log};
    ResultCoordinator results{registry, api, board, log};
    std::ostringstream out;
    int quit_calls{0};
    CommandRouter router{registry, distributor, results, out, log, [this] { ++quit_calls; }};

    std::shared_ptr<QueueChannel> connect(const std::string& peer) {
        auto ch = std::make_shared<QueueChannel>(peer);
        registry.add(ch);
        return ch;
    }
};

} // namespace

TEST_SUITE("Command Router") {
    TEST_CASE("status without workers") {
        Console c;
        CHECK(c.router.dispatch("status"));
        CHECK(c.out.str() == "No workers connected.\n");
    }

    TEST_CASE("status lists endpoints") {
        Console c;
        c.connect("127.0.0.1:40001");
        c.connect("127.0.0.1:40002");
        c.router.dispatch("status");
        auto text = c.out.str();
        CHECK(text.find(" - 127.0.0.1:40001\n") != std::string::npos);
        CHECK(text.find(" - 127.0.0.1:40002\n") != std::string::npos);
        CHECK(text.find("127.0.0.1:40001") < text.find("127.0.0.1:40002"));
    }

    TEST_CASE("case and whitespace are ignored") {
        Console c;
        CHECK(c.router.dispatch("  STATUS \t"));
        CHECK(c.out.str() == "No workers connected.\n");
    }

    TEST_CASE("empty input is ignored") {
        Console c;
        CHECK(c.router.dispatch(""));
        CHECK(c.router.dispatch("   "));
        CHECK(c.out.str().empty());
    }

    TEST_CASE("unknown command") {
        Console c;
        auto ch = c.connect("a:1");
        CHECK(c.router.dispatch("launch rockets"));
        CHECK(c.out.str() == "Unknown command: launch rockets\n");
        CHECK(ch->written().empty());
        CHECK(c.quit_calls == 0);
    }

    TEST_CASE("solve forwards the difficulty") {
        Console c;
        auto ch = c.connect("a:1");
        CHECK(c.router.dispatch("Solve 5"));
        CHECK(ch->written() == std::vector<std::string>{"NONCE 0 1", "PAYLOAD task-data", "SOLVE 5"});
    }

    TEST_CASE("solve with a bad argument keeps running") {
        Console c;
        auto ch = c.connect("a:1");
        CHECK(c.router.dispatch("solve x"));
        CHECK(c.router.dispatch("solve"));
        CHECK(ch->written().empty());
    }

    TEST_CASE("cancel broadcasts and clears the task") {
        Console c;
        auto ch = c.connect("a:1");
        c.board.set(MiningTask{3, "p", 1});
        CHECK(c.router.dispatch("cancel"));
        CHECK(ch->written() == std::vector<std::string>{"CANCELLED"});
        CHECK_FALSE(c.board.active());
    }

    TEST_CASE("cancel without a task still broadcasts") {
        Console c;
        auto ch = c.connect("a:1");
        c.router.dispatch("cancel");
        CHECK(ch->written() == std::vector<std::string>{"CANCELLED"});
    }

    TEST_CASE("progress broadcasts") {
        Console c;
        auto a = c.connect("a:1");
        auto b = c.connect("b:1");
        c.router.dispatch("progress");
        CHECK(a->written() == std::vector<std::string>{"PROGRESS"});
        CHECK(b->written() == std::vector<std::string>{"PROGRESS"});
    }

    TEST_CASE("help lists every command") {
        Console c;
        c.router.dispatch("help");
        auto text = c.out.str();
        for (const char* cmd : {"status", "solve", "cancel", "progress", "help", "quit"}) {
            CHECK_MESSAGE(text.find(cmd) != std::string::npos, cmd);
        }
    }

    TEST_CASE("quit closes everything and stops") {
        Console c;
        auto a = c.connect("a:1");
        CHECK_FALSE(c.router.dispatch("quit"));
        CHECK(c.quit_calls == 1);
        CHECK(a->closed());
        CHECK(c.registry.empty());
    }
}
