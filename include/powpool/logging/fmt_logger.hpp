#pragma once

#include <powpool/logging/logger.hpp>

#include <atomic>
#include <mutex>

namespace powpool::logging {

// Console logger. Safe to share between connection, search and console threads.
class FmtLogger : public Logger {
public:
    explicit FmtLogger(bool enable_debug = false) : enable_debug_(enable_debug) {}
    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;

    void set_debug(bool v) { enable_debug_.store(v); }

private:
    void print_line_stdout(std::string_view level, std::string_view msg);
    void print_line_stderr(std::string_view level, std::string_view msg);

    std::atomic<bool> enable_debug_{false};
    std::mutex print_mutex_;
};

} // namespace powpool::logging
