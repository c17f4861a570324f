#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <powpool/logging/logger.hpp>
#include <powpool/protocol/line_channel.hpp>

namespace powpool::protocol {

// Each state names the reply the prompter is waiting for.
enum class HandshakeState {
    Init,
    AwaitItsMe,
    AwaitPasswd,
    AwaitReady,
    Authenticated,
    Rejected,
};

std::string_view to_string(HandshakeState state);

/**
 * Coordinator side of the 4-step challenge/response:
 *   WHO_ARE_YOU_? / ITS_ME, GIMME_PASSWORD / PASSWD <secret>, HELLO_YOU / READY, OK.
 * Any deviation rejects. A fresh instance is used per connection.
 */
class ServerHandshake {
public:
    explicit ServerHandshake(std::string secret) : secret_(std::move(secret)) {}

    // Init -> AwaitItsMe. Returns the first prompt.
    std::string start();

    // Consumes one worker reply and returns the line to send back: the next
    // prompt, OK on success, or the rejection notice.
    std::string on_reply(std::string_view line);

    // Peer closed the stream mid-handshake.
    void on_eof() { state_ = HandshakeState::Rejected; }

    HandshakeState state() const { return state_; }
    bool finished() const {
        return state_ == HandshakeState::Authenticated || state_ == HandshakeState::Rejected;
    }

private:
    std::string reject();
    bool secret_matches(std::string_view line) const;

    std::string secret_;
    HandshakeState state_{HandshakeState::Init};
};

// Worker side: answers the prompts with the configured secret.
class ClientHandshake {
public:
    explicit ClientHandshake(std::string secret) : secret_(std::move(secret)) {}

    // Consumes one coordinator line. Returns the reply to send, if any.
    std::optional<std::string> on_prompt(std::string_view line);

    void on_eof() { state_ = HandshakeState::Rejected; }

    HandshakeState state() const { return state_; }
    bool finished() const {
        return state_ == HandshakeState::Authenticated || state_ == HandshakeState::Rejected;
    }

private:
    std::string secret_;
    HandshakeState state_{HandshakeState::Init};
};

// Runs the coordinator side over a channel. On rejection the notice is sent
// and the channel closed. Returns Authenticated or Rejected.
HandshakeState authenticate(LineChannel& channel, const std::string& secret,
                            powpool::logging::Logger& log);

// Runs the worker side over a channel. Returns Authenticated or Rejected.
HandshakeState respond(LineChannel& channel, const std::string& secret,
                       powpool::logging::Logger& log);

} // namespace powpool::protocol
