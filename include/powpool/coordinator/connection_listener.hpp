#pragma once

#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <powpool/coordinator/result_coordinator.hpp>
#include <powpool/coordinator/worker_registry.hpp>
#include <powpool/logging/logger.hpp>
#include <powpool/protocol/line_channel.hpp>

namespace powpool::coordinator {

/**
 * Accepts worker connections and serves each one on its own thread.
 *
 * The acceptor runs asynchronously on the io_context from a dedicated accept
 * thread. Every accepted socket is handed to a connection thread that runs the
 * handshake, registers the worker and then reads its reports until the stream
 * ends.
 */
class ConnectionListener {
public:
    ConnectionListener(asio::io_context& ioc, std::string secret, WorkerRegistry& registry,
                       ResultCoordinator& results, powpool::logging::Logger& log);
    ~ConnectionListener();

    ConnectionListener(const ConnectionListener&) = delete;
    ConnectionListener& operator=(const ConnectionListener&) = delete;

    // Binds to port (0 picks an ephemeral one) and starts accepting.
    // Throws protocol::ChannelError when the port cannot be bound.
    void start(std::uint16_t port);

    // Closes the acceptor, shuts every connection down and joins all threads.
    void stop();

    std::uint16_t port() const { return port_; }
    bool running() const { return running_.load(); }

private:
    struct Connection {
        std::shared_ptr<protocol::LineChannel> channel;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread thread;
    };

    void accept_next();
    void spawn(asio::ip::tcp::socket socket);
    void serve(const std::shared_ptr<protocol::LineChannel>& channel);
    void handle_report(const WorkerHandlePtr& handle, const std::string& line);
    void reap_finished();

    asio::io_context& ioc_;
    std::string secret_;
    WorkerRegistry& registry_;
    ResultCoordinator& results_;
    powpool::logging::Logger& log_;

    asio::ip::tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
    std::uint16_t port_{0};

    std::mutex connections_mutex_;
    std::list<Connection> connections_;
};

} // namespace powpool::coordinator
