#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/streambuf.hpp>

#include <powpool/protocol/line_channel.hpp>

namespace powpool::protocol {

// LineChannel over a connected asio TCP socket using blocking reads and writes.
class TcpLineChannel : public LineChannel {
public:
    explicit TcpLineChannel(asio::ip::tcp::socket socket);
    ~TcpLineChannel() override;

    TcpLineChannel(const TcpLineChannel&) = delete;
    TcpLineChannel& operator=(const TcpLineChannel&) = delete;

    // Resolve and connect. Throws ChannelError when no endpoint accepts.
    static std::shared_ptr<TcpLineChannel> connect(asio::io_context& ioc,
                                                   const std::string& host,
                                                   const std::string& port);

    std::optional<std::string> read_line() override;
    void write_line(std::string_view line) override;
    void close() override;
    std::string peer() const override { return peer_; }

private:
    asio::ip::tcp::socket socket_;
    asio::streambuf buffer_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{false};
    std::string peer_;
};

} // namespace powpool::protocol
