/*
 * powpool coordinator
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <iostream>
#include <memory>
#include <string>

#include <fmt/core.h>

#include <powpool/cli/args.hpp>
#include <powpool/coordinator/coordinator.hpp>
#include <powpool/coordinator/http_work_api.hpp>
#include <powpool/logging/fmt_logger.hpp>
#include <powpool/protocol/line_channel.hpp>

#ifndef POWPOOL_VERSION
#define POWPOOL_VERSION "0.0.0"
#endif

static std::string mask(const std::string& secret) {
    return std::string(secret.size(), '*');
}

int main(int argc, char** argv) {
    powpool::logging::FmtLogger log;
    auto parsed = powpool::cli::parse_coordinator(argc, argv, log);
    if (parsed.show_only) return 0;
    if (!parsed.cfg) return 1;
    log.set_debug(parsed.debug);
    const auto& cfg = *parsed.cfg;

    fmt::print("powpool-coordinator v{}\n", POWPOOL_VERSION);
    fmt::print("  port     : {}\n", cfg.port);
    fmt::print("  password : {}\n", mask(cfg.password));
    fmt::print("  api url  : {}\n", cfg.api_url);
    fmt::print("Type 'help' for the list of commands.\n");

    auto api = std::make_unique<powpool::coordinator::HttpWorkApi>(cfg.api_url, cfg.api_key, log);
    powpool::coordinator::Coordinator coordinator(cfg, std::move(api), log);
    try {
        coordinator.start();
    } catch (const powpool::protocol::ChannelError& e) {
        log.error(fmt::format("Cannot start listener: {}", e.what()));
        return 1;
    }
    return coordinator.run_console(std::cin, std::cout);
}
