/*
 * Unit tests for the authentication handshake
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <powpool/protocol/handshake.hpp>

#include "test_support.hpp"

using namespace powpool::protocol;
using powpool::testing::CaptureLogger;
using powpool::testing::QueueChannel;

TEST_SUITE("Server Handshake") {
    TEST_CASE("happy path") {
        ServerHandshake hs("secret123");
        CHECK(hs.state() == HandshakeState::Init);
        CHECK(hs.start() == "WHO_ARE_YOU_?");
        CHECK(hs.on_reply("ITS_ME") == "GIMME_PASSWORD");
        CHECK(hs.on_reply("PASSWD secret123") == "HELLO_YOU");
        CHECK(hs.on_reply("READY") == "OK");
        CHECK(hs.state() == HandshakeState::Authenticated);
        CHECK(hs.finished());
    }

    TEST_CASE("wrong identity rejects") {
        ServerHandshake hs("s");
        hs.start();
        CHECK(hs.on_reply("HELLO") == "YOU_DONT_FOOL_ME");
        CHECK(hs.state() == HandshakeState::Rejected);
    }

    TEST_CASE("wrong password rejects") {
        ServerHandshake hs("secret123");
        hs.start();
        hs.on_reply("ITS_ME");
        CHECK(hs.on_reply("PASSWD wrong") == "YOU_DONT_FOOL_ME");
        CHECK(hs.state() == HandshakeState::Rejected);
    }

    TEST_CASE("password prefix or suffix does not match") {
        for (const char* reply : {"PASSWD secret12", "PASSWD secret1234", "PASSWD", "PASSWDsecret123", "passwd secret123"}) {
            ServerHandshake hs("secret123");
            hs.start();
            hs.on_reply("ITS_ME");
            hs.on_reply(reply);
            CHECK_MESSAGE(hs.state() == HandshakeState::Rejected, reply);
        }
    }

    TEST_CASE("wrong ready rejects") {
        ServerHandshake hs("s");
        hs.start();
        hs.on_reply("ITS_ME");
        hs.on_reply("PASSWD s");
        CHECK(hs.on_reply("OK") == "YOU_DONT_FOOL_ME");
        CHECK(hs.state() == HandshakeState::Rejected);
    }

    TEST_CASE("carriage return tolerated") {
        ServerHandshake hs("s");
        hs.start();
        CHECK(hs.on_reply("ITS_ME\r") == "GIMME_PASSWORD");
    }

    TEST_CASE("end of stream rejects") {
        ServerHandshake hs("s");
        hs.start();
        hs.on_reply("ITS_ME");
        hs.on_eof();
        CHECK(hs.state() == HandshakeState::Rejected);
    }

    TEST_CASE("reply after finish is a logic error") {
        ServerHandshake hs("s");
        hs.start();
        hs.on_reply("nope");
        CHECK_THROWS_AS(hs.on_reply("ITS_ME"), std::logic_error);
    }
}

TEST_SUITE("Client Handshake") {
    TEST_CASE("answers every prompt") {
        ClientHandshake hs("pw");
        CHECK(hs.on_prompt("WHO_ARE_YOU_?") == std::optional<std::string>("ITS_ME"));
        CHECK(hs.on_prompt("GIMME_PASSWORD") == std::optional<std::string>("PASSWD pw"));
        CHECK(hs.on_prompt("HELLO_YOU") == std::optional<std::string>("READY"));
        CHECK_FALSE(hs.on_prompt("OK").has_value());
        CHECK(hs.state() == HandshakeState::Authenticated);
    }

    TEST_CASE("rejection notice") {
        ClientHandshake hs("pw");
        hs.on_prompt("WHO_ARE_YOU_?");
        hs.on_prompt("GIMME_PASSWORD");
        CHECK_FALSE(hs.on_prompt("YOU_DONT_FOOL_ME").has_value());
        CHECK(hs.state() == HandshakeState::Rejected);
    }

    TEST_CASE("out of order prompt") {
        ClientHandshake hs("pw");
        CHECK_FALSE(hs.on_prompt("HELLO_YOU").has_value());
        CHECK(hs.state() == HandshakeState::Rejected);
    }
}

TEST_SUITE("Handshake over a channel") {
    TEST_CASE("authenticate succeeds") {
        CaptureLogger log;
        QueueChannel ch{"ITS_ME", "PASSWD secret123", "READY"};
        CHECK(authenticate(ch, "secret123", log) == HandshakeState::Authenticated);
        CHECK(ch.written() == std::vector<std::string>{"WHO_ARE_YOU_?", "GIMME_PASSWORD", "HELLO_YOU", "OK"});
        CHECK_FALSE(ch.closed());
    }

    TEST_CASE("authenticate sends rejection then closes") {
        CaptureLogger log;
        QueueChannel ch{"ITS_ME", "PASSWD wrong"};
        CHECK(authenticate(ch, "secret123", log) == HandshakeState::Rejected);
        auto w = ch.written();
        REQUIRE(w.size() == 3);
        CHECK(w.back() == "YOU_DONT_FOOL_ME");
        CHECK(ch.closed());
    }

    TEST_CASE("authenticate on early end of stream") {
        CaptureLogger log;
        QueueChannel ch{"ITS_ME"};
        CHECK(authenticate(ch, "s", log) == HandshakeState::Rejected);
        CHECK(ch.closed());
    }

    TEST_CASE("respond drives the worker side") {
        CaptureLogger log;
        QueueChannel ch{"WHO_ARE_YOU_?", "GIMME_PASSWORD", "HELLO_YOU", "OK"};
        CHECK(respond(ch, "pw", log) == HandshakeState::Authenticated);
        CHECK(ch.written() == std::vector<std::string>{"ITS_ME", "PASSWD pw", "READY"});
    }

    TEST_CASE("respond reports rejection") {
        CaptureLogger log;
        QueueChannel ch{"WHO_ARE_YOU_?", "GIMME_PASSWORD", "YOU_DONT_FOOL_ME"};
        CHECK(respond(ch, "pw", log) == HandshakeState::Rejected);
        CHECK(log.contains("rejected"));
    }
}
