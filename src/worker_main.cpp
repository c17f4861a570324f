/*
 * powpool worker
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <memory>
#include <string>

#include <asio/io_context.hpp>
#include <fmt/core.h>

#include <powpool/cli/args.hpp>
#include <powpool/config/validator.hpp>
#include <powpool/logging/fmt_logger.hpp>
#include <powpool/protocol/tcp_channel.hpp>
#include <powpool/worker/worker_session.hpp>

#ifndef POWPOOL_VERSION
#define POWPOOL_VERSION "0.0.0"
#endif

int main(int argc, char** argv) {
    powpool::logging::FmtLogger log;
    auto parsed = powpool::cli::parse_worker(argc, argv, log);
    if (parsed.show_only) return 0;
    if (!parsed.cfg) return 1;
    log.set_debug(parsed.debug);
    const auto& cfg = *parsed.cfg;

    std::string host, port;
    powpool::config::split_host_port(cfg.server, host, port);

    fmt::print("powpool-worker v{}\n", POWPOOL_VERSION);
    fmt::print("  server   : {}\n", cfg.server);

    asio::io_context ioc;
    std::shared_ptr<powpool::protocol::TcpLineChannel> channel;
    try {
        channel = powpool::protocol::TcpLineChannel::connect(ioc, host, port);
    } catch (const powpool::protocol::ChannelError& e) {
        log.error(fmt::format("Cannot reach coordinator: {}", e.what()));
        return 1;
    }
    log.info(fmt::format("Connected to {}", channel->peer()));

    powpool::worker::WorkerSession session(channel, cfg.password, log);
    return session.run() ? 0 : 1;
}
