#pragma once

#include <powpool/config/types.hpp>
#include <powpool/logging/logger.hpp>

namespace powpool::cli {

// Parse CLI using cxxopts, layered over config file and environment
// (defaults < file < env < CLI). Writes help/version and errors through the logger.
powpool::config::ParseResult<powpool::config::CoordinatorConfig>
parse_coordinator(int argc, char** argv, powpool::logging::Logger& log);

powpool::config::ParseResult<powpool::config::WorkerConfig>
parse_worker(int argc, char** argv, powpool::logging::Logger& log);

} // namespace powpool::cli
