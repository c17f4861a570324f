#include <powpool/logging/fmt_logger.hpp>
#include <powpool/log.hpp>

#include <cstdio>
#include <fmt/core.h>

namespace powpool::logging {

void FmtLogger::print_line_stdout(std::string_view level, std::string_view msg) {
    std::lock_guard<std::mutex> lock(print_mutex_);
    fmt::print("{}\n", powpool::log::stamp(level, msg));
    std::fflush(stdout);
}

void FmtLogger::print_line_stderr(std::string_view level, std::string_view msg) {
    std::lock_guard<std::mutex> lock(print_mutex_);
    fmt::print(stderr, "{}\n", powpool::log::stamp(level, msg));
}

void FmtLogger::info(std::string_view msg) { print_line_stdout("INFO", msg); }
void FmtLogger::warn(std::string_view msg) { print_line_stdout("WARN", msg); }
void FmtLogger::error(std::string_view msg) { print_line_stderr("ERROR", msg); }
void FmtLogger::debug(std::string_view msg) {
    if (enable_debug_.load()) print_line_stdout("DEBUG", msg);
}

} // namespace powpool::logging
