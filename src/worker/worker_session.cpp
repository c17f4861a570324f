#include <powpool/worker/worker_session.hpp>

#include <fmt/format.h>

#include <powpool/protocol/handshake.hpp>

namespace powpool::worker {

namespace verb = protocol::verb;

WorkerSession::WorkerSession(std::shared_ptr<protocol::LineChannel> channel, std::string secret,
                             powpool::logging::Logger& log)
    : channel_(std::move(channel)), secret_(std::move(secret)), log_(log), engine_(running_, log) {
    handlers_.emplace(verb::kNonce, [this](const protocol::Message& m) { on_nonce(m); });
    handlers_.emplace(verb::kPayload, [this](const protocol::Message& m) { on_payload(m); });
    handlers_.emplace(verb::kSolve, [this](const protocol::Message& m) { on_solve(m); });
    handlers_.emplace(verb::kProgress, [this](const protocol::Message& m) { on_progress(m); });
    handlers_.emplace(verb::kCancelled, [this](const protocol::Message& m) { on_cancelled(m); });
    handlers_.emplace(verb::kQuit, [this](const protocol::Message& m) { on_quit(m); });
    handlers_.emplace(verb::kStatus, [this](const protocol::Message&) { send(verb::kStatusOk); });
    handlers_.emplace(verb::kOk, [](const protocol::Message&) {});
}

WorkerSession::~WorkerSession() { stop_search(); }

bool WorkerSession::run() {
    if (protocol::respond(*channel_, secret_, log_) != protocol::HandshakeState::Authenticated) {
        channel_->close();
        return false;
    }
    log_.info(fmt::format("Authenticated with coordinator {}", channel_->peer()));

    try {
        while (auto line = channel_->read_line()) {
            dispatch(*line);
        }
        log_.info("Coordinator closed the connection");
    } catch (const protocol::ChannelError& e) {
        log_.error(fmt::format("Connection lost: {}", e.what()));
    }

    stop_search();
    channel_->close();
    return true;
}

void WorkerSession::dispatch(std::string_view line) {
    auto msg = protocol::parse(line);
    auto it = handlers_.find(msg.verb);
    if (it == handlers_.end()) {
        log_.warn(fmt::format("Unknown command: {}", line));
        return;
    }
    log_.debug(fmt::format("<- {}", line));
    it->second(msg);
}

void WorkerSession::on_nonce(const protocol::Message& msg) {
    auto range = protocol::parse_nonce(msg);
    if (!range) {
        log_.error(fmt::format("Invalid nonce assignment: {}", msg.rest));
        return;
    }
    range_ = range;
    log_.info(fmt::format("Assigned nonces {} + k*{}", range->start, range->step));
}

void WorkerSession::on_payload(const protocol::Message& msg) {
    payload_ = msg.rest;
    log_.debug(fmt::format("Payload: {}", msg.rest));
}

void WorkerSession::on_solve(const protocol::Message& msg) {
    auto difficulty = msg.args.size() == 1 ? protocol::parse_int(msg.args[0]) : std::nullopt;
    if (!difficulty || *difficulty < 0 || *difficulty > 64) {
        log_.error(fmt::format("Invalid difficulty: {}", msg.rest));
        return;
    }
    if (!payload_) {
        log_.error("SOLVE received before PAYLOAD, ignoring");
        return;
    }

    stop_search();

    SearchTask task;
    task.payload = *payload_;
    task.difficulty = *difficulty;
    if (range_) {
        task.start = range_->start;
        task.step = range_->step;
    }

    engine_.prepare(task);
    running_.store(true);
    search_thread_ = std::thread([this, task] {
        engine_.run(task, [this](std::string_view line) { send(line); });
    });
}

void WorkerSession::on_progress(const protocol::Message&) {
    if (running_.load()) {
        send(protocol::build_testing(engine_.current_nonce().str()));
    } else {
        send(verb::kNope);
    }
}

void WorkerSession::on_cancelled(const protocol::Message&) {
    running_.store(false);
    send(verb::kReady);
}

void WorkerSession::on_quit(const protocol::Message&) {
    running_.store(false);
}

void WorkerSession::stop_search() {
    running_.store(false);
    wait_search();
}

void WorkerSession::wait_search() {
    if (search_thread_.joinable()) search_thread_.join();
}

void WorkerSession::send(std::string_view line) {
    try {
        channel_->write_line(line);
    } catch (const protocol::ChannelError& e) {
        log_.error(fmt::format("Failed to send '{}': {}", line, e.what()));
    }
}

} // namespace powpool::worker
