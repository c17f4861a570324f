#include <powpool/protocol/tcp_channel.hpp>

#include <istream>

#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>
#include <fmt/format.h>

namespace powpool::protocol {

static std::string endpoint_string(const asio::ip::tcp::socket& socket) {
    std::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec) return "unknown";
    return fmt::format("{}:{}", ep.address().to_string(), ep.port());
}

TcpLineChannel::TcpLineChannel(asio::ip::tcp::socket socket)
    : socket_(std::move(socket)), peer_(endpoint_string(socket_)) {}

TcpLineChannel::~TcpLineChannel() {
    std::error_code ignored;
    socket_.close(ignored);
}

std::shared_ptr<TcpLineChannel> TcpLineChannel::connect(asio::io_context& ioc,
                                                        const std::string& host,
                                                        const std::string& port) {
    std::error_code ec;
    asio::ip::tcp::resolver resolver{ioc};
    auto endpoints = resolver.resolve(host, port, ec);
    if (ec) throw ChannelError(fmt::format("resolve {}:{}: {}", host, port, ec.message()));

    asio::ip::tcp::socket socket{ioc};
    asio::connect(socket, endpoints, ec);
    if (ec) throw ChannelError(fmt::format("connect {}:{}: {}", host, port, ec.message()));
    return std::make_shared<TcpLineChannel>(std::move(socket));
}

std::optional<std::string> TcpLineChannel::read_line() {
    std::error_code ec;
    asio::read_until(socket_, buffer_, '\n', ec);
    if (ec) {
        if (closed_.load()) return std::nullopt;
        if (ec != asio::error::eof) throw ChannelError(fmt::format("read from {}: {}", peer_, ec.message()));
        if (buffer_.size() == 0) return std::nullopt;
        // unterminated trailing line before EOF
    }

    std::istream is(&buffer_);
    std::string line;
    std::getline(is, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

void TcpLineChannel::write_line(std::string_view line) {
    std::string out;
    out.reserve(line.size() + 1);
    out.append(line);
    out.push_back('\n');

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_.load()) throw ChannelError(fmt::format("write to {}: channel closed", peer_));
    std::error_code ec;
    asio::write(socket_, asio::buffer(out), ec);
    if (ec) throw ChannelError(fmt::format("write to {}: {}", peer_, ec.message()));
}

void TcpLineChannel::close() {
    if (closed_.exchange(true)) return;
    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
}

} // namespace powpool::protocol
