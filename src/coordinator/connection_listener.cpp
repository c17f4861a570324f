#include <powpool/coordinator/connection_listener.hpp>

#include <iterator>

#include <asio/error.hpp>
#include <asio/post.hpp>
#include <fmt/format.h>

#include <powpool/protocol/handshake.hpp>
#include <powpool/protocol/messages.hpp>
#include <powpool/protocol/tcp_channel.hpp>

namespace powpool::coordinator {

ConnectionListener::ConnectionListener(asio::io_context& ioc, std::string secret,
                                       WorkerRegistry& registry, ResultCoordinator& results,
                                       powpool::logging::Logger& log)
    : ioc_(ioc),
      secret_(std::move(secret)),
      registry_(registry),
      results_(results),
      log_(log),
      acceptor_(ioc) {}

ConnectionListener::~ConnectionListener() { stop(); }

void ConnectionListener::start(std::uint16_t port) {
    if (running_.load()) return;

    std::error_code ec;
    asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), port);
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw protocol::ChannelError(fmt::format("open acceptor: {}", ec.message()));
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(endpoint, ec);
    if (ec) {
        std::error_code ignored;
        acceptor_.close(ignored);
        throw protocol::ChannelError(fmt::format("bind port {}: {}", port, ec.message()));
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        std::error_code ignored;
        acceptor_.close(ignored);
        throw protocol::ChannelError(fmt::format("listen on port {}: {}", port, ec.message()));
    }
    port_ = acceptor_.local_endpoint(ec).port();

    running_.store(true);
    accept_next();
    accept_thread_ = std::thread([this] { ioc_.run(); });
    log_.info(fmt::format("Listening for workers on port {}", port_));
}

void ConnectionListener::accept_next() {
    acceptor_.async_accept([this](const std::error_code& ec, asio::ip::tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !running_.load()) return;
        if (ec) {
            log_.error(fmt::format("Accept failed: {}", ec.message()));
        } else {
            spawn(std::move(socket));
        }
        accept_next();
    });
}

void ConnectionListener::spawn(asio::ip::tcp::socket socket) {
    auto channel = std::make_shared<protocol::TcpLineChannel>(std::move(socket));
    log_.info(fmt::format("New connection from {}", channel->peer()));

    reap_finished();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(connections_mutex_);
    Connection conn;
    conn.channel = channel;
    conn.done = done;
    conn.thread = std::thread([this, channel, done] {
        serve(channel);
        done->store(true);
    });
    connections_.push_back(std::move(conn));
}

void ConnectionListener::serve(const std::shared_ptr<protocol::LineChannel>& channel) {
    if (protocol::authenticate(*channel, secret_, log_) != protocol::HandshakeState::Authenticated) {
        return;
    }

    auto handle = registry_.add(channel);
    log_.info(fmt::format("Worker {} authenticated ({} connected)", handle->endpoint(), registry_.size()));

    try {
        while (auto line = channel->read_line()) {
            handle_report(handle, *line);
        }
    } catch (const protocol::ChannelError& e) {
        log_.warn(fmt::format("Connection to {} failed: {}", handle->endpoint(), e.what()));
    } catch (const std::exception& e) {
        log_.error(fmt::format("Error serving {}: {}", handle->endpoint(), e.what()));
    }

    registry_.remove(handle);
    handle->close();
    log_.info(fmt::format("Worker {} disconnected", handle->endpoint()));
}

void ConnectionListener::handle_report(const WorkerHandlePtr& handle, const std::string& line) {
    auto msg = protocol::parse(line);
    switch (protocol::classify_report(msg)) {
    case protocol::ReportKind::Found:
        results_.on_found(msg, handle->endpoint());
        break;
    case protocol::ReportKind::Testing:
        log_.info(fmt::format("Worker {} is testing nonce {}", handle->endpoint(), msg.rest));
        break;
    case protocol::ReportKind::Nope:
        log_.info(fmt::format("Worker {} is not searching", handle->endpoint()));
        break;
    case protocol::ReportKind::Ready:
        log_.debug(fmt::format("Worker {} is ready", handle->endpoint()));
        break;
    case protocol::ReportKind::StatusOk:
        log_.debug(fmt::format("Worker {} is alive", handle->endpoint()));
        break;
    case protocol::ReportKind::Unknown:
        log_.warn(fmt::format("Unrecognized message from {}: {}", handle->endpoint(), line));
        break;
    }
}

void ConnectionListener::reap_finished() {
    std::list<Connection> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), connections_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& conn : finished) {
        if (conn.thread.joinable()) conn.thread.join();
    }
}

void ConnectionListener::stop() {
    if (!running_.exchange(false)) return;

    asio::post(ioc_, [this] {
        std::error_code ignored;
        acceptor_.close(ignored);
    });
    if (accept_thread_.joinable()) accept_thread_.join();

    std::list<Connection> open;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        open.swap(connections_);
    }
    for (auto& conn : open) conn.channel->close();
    for (auto& conn : open) {
        if (conn.thread.joinable()) conn.thread.join();
    }
    log_.info("Listener stopped");
}

} // namespace powpool::coordinator
