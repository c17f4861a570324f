#include <powpool/protocol/handshake.hpp>
#include <powpool/protocol/messages.hpp>

#include <stdexcept>

#include <fmt/format.h>
#include <openssl/crypto.h>

namespace powpool::protocol {

std::string_view to_string(HandshakeState state) {
    switch (state) {
        case HandshakeState::Init:          return "INIT";
        case HandshakeState::AwaitItsMe:    return "AWAIT_ITS_ME";
        case HandshakeState::AwaitPasswd:   return "AWAIT_PASSWD";
        case HandshakeState::AwaitReady:    return "AWAIT_READY";
        case HandshakeState::Authenticated: return "AUTHENTICATED";
        case HandshakeState::Rejected:      return "REJECTED";
    }
    return "UNKNOWN";
}

std::string ServerHandshake::start() {
    if (state_ != HandshakeState::Init) throw std::logic_error("handshake already started");
    state_ = HandshakeState::AwaitItsMe;
    return std::string(verb::kWhoAreYou);
}

std::string ServerHandshake::reject() {
    state_ = HandshakeState::Rejected;
    return std::string(verb::kRejected);
}

bool ServerHandshake::secret_matches(std::string_view line) const {
    const std::string expected = build_passwd(secret_);
    if (line.size() != expected.size()) return false;
    return CRYPTO_memcmp(line.data(), expected.data(), expected.size()) == 0;
}

static std::string_view strip_cr(std::string_view line) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line;
}

std::string ServerHandshake::on_reply(std::string_view line) {
    line = strip_cr(line);
    switch (state_) {
        case HandshakeState::AwaitItsMe:
            if (line != verb::kItsMe) return reject();
            state_ = HandshakeState::AwaitPasswd;
            return std::string(verb::kGimmePassword);
        case HandshakeState::AwaitPasswd:
            if (!secret_matches(line)) return reject();
            state_ = HandshakeState::AwaitReady;
            return std::string(verb::kHelloYou);
        case HandshakeState::AwaitReady:
            if (line != verb::kReady) return reject();
            state_ = HandshakeState::Authenticated;
            return std::string(verb::kOk);
        default:
            throw std::logic_error(fmt::format("handshake reply in state {}", to_string(state_)));
    }
}

std::optional<std::string> ClientHandshake::on_prompt(std::string_view line) {
    if (finished()) throw std::logic_error(fmt::format("handshake prompt in state {}", to_string(state_)));
    line = strip_cr(line);

    if (state_ == HandshakeState::Init && line == verb::kWhoAreYou) {
        state_ = HandshakeState::AwaitItsMe;
        return std::string(verb::kItsMe);
    }
    if (state_ == HandshakeState::AwaitItsMe && line == verb::kGimmePassword) {
        state_ = HandshakeState::AwaitPasswd;
        return build_passwd(secret_);
    }
    if (state_ == HandshakeState::AwaitPasswd && line == verb::kHelloYou) {
        state_ = HandshakeState::AwaitReady;
        return std::string(verb::kReady);
    }
    if (state_ == HandshakeState::AwaitReady && line == verb::kOk) {
        state_ = HandshakeState::Authenticated;
        return std::nullopt;
    }
    // YOU_DONT_FOOL_ME or an out-of-order prompt
    state_ = HandshakeState::Rejected;
    return std::nullopt;
}

HandshakeState authenticate(LineChannel& channel, const std::string& secret,
                            powpool::logging::Logger& log) {
    ServerHandshake hs(secret);
    try {
        channel.write_line(hs.start());
        while (!hs.finished()) {
            auto line = channel.read_line();
            if (!line) {
                hs.on_eof();
                break;
            }
            channel.write_line(hs.on_reply(*line));
        }
    } catch (const ChannelError& e) {
        log.warn(fmt::format("Handshake with {} failed: {}", channel.peer(), e.what()));
        channel.close();
        return HandshakeState::Rejected;
    }

    if (hs.state() != HandshakeState::Authenticated) {
        log.info(fmt::format("Worker {} failed authentication", channel.peer()));
        channel.close();
    }
    return hs.state();
}

HandshakeState respond(LineChannel& channel, const std::string& secret,
                       powpool::logging::Logger& log) {
    ClientHandshake hs(secret);
    try {
        while (!hs.finished()) {
            auto line = channel.read_line();
            if (!line) {
                hs.on_eof();
                break;
            }
            log.debug(fmt::format("<- {}", *line));
            if (auto reply = hs.on_prompt(*line)) channel.write_line(*reply);
        }
    } catch (const ChannelError& e) {
        log.error(fmt::format("Handshake failed: {}", e.what()));
        return HandshakeState::Rejected;
    }
    if (hs.state() == HandshakeState::Rejected) {
        log.error("Coordinator rejected the handshake (check the shared password)");
    }
    return hs.state();
}

} // namespace powpool::protocol
