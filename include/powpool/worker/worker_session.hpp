#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <powpool/logging/logger.hpp>
#include <powpool/protocol/line_channel.hpp>
#include <powpool/protocol/messages.hpp>
#include <powpool/worker/search_engine.hpp>

namespace powpool::worker {

/**
 * Worker end of one coordinator connection.
 *
 * run() answers the handshake, then dispatches coordinator verbs until end of
 * stream. Searches run on their own thread and share only the running flag
 * with the dispatch loop.
 */
class WorkerSession {
public:
    WorkerSession(std::shared_ptr<protocol::LineChannel> channel, std::string secret,
                  powpool::logging::Logger& log);
    ~WorkerSession();

    WorkerSession(const WorkerSession&) = delete;
    WorkerSession& operator=(const WorkerSession&) = delete;

    // Returns false when the coordinator rejected the handshake.
    bool run();

    // Handles one coordinator line.
    void dispatch(std::string_view line);

    bool searching() const { return running_.load(); }

    // Blocks until the current search thread (if any) has exited.
    void wait_search();

private:
    using Handler = std::function<void(const protocol::Message&)>;

    void on_nonce(const protocol::Message& msg);
    void on_payload(const protocol::Message& msg);
    void on_solve(const protocol::Message& msg);
    void on_progress(const protocol::Message& msg);
    void on_cancelled(const protocol::Message& msg);
    void on_quit(const protocol::Message& msg);

    void stop_search();
    void send(std::string_view line);

    std::shared_ptr<protocol::LineChannel> channel_;
    std::string secret_;
    powpool::logging::Logger& log_;
    std::map<std::string, Handler, std::less<>> handlers_;

    std::atomic<bool> running_{false};
    SearchEngine engine_;
    std::thread search_thread_;

    std::optional<protocol::NonceRange> range_;
    std::optional<std::string> payload_;
};

} // namespace powpool::worker
