#include <powpool/cli/args.hpp>
#include <powpool/config/loader.hpp>
#include <powpool/config/validator.hpp>

#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <fmt/core.h>

#ifndef POWPOOL_VERSION
#define POWPOOL_VERSION "0.0.0"
#endif

namespace powpool::cli {

using powpool::config::CoordinatorConfig;
using powpool::config::ParseResult;
using powpool::config::WorkerConfig;

static bool report(powpool::logging::Logger& log, const std::vector<std::string>& errs) {
    for (const auto& e : errs) log.error(e);
    return errs.empty();
}

ParseResult<CoordinatorConfig> parse_coordinator(int argc, char** argv, powpool::logging::Logger& log) {
    ParseResult<CoordinatorConfig> pr;
    cxxopts::Options options("powpool-coordinator", "Proof-of-work coordinator for a pool of hash workers");
    options.add_options()
        ("port",     "Listening port", cxxopts::value<std::string>())
        ("password", "Shared worker secret (env PASSWORD)", cxxopts::value<std::string>())
        ("api-key",  "Work API bearer key (env API_KEY)", cxxopts::value<std::string>())
        ("api-url",  "Work API base URL", cxxopts::value<std::string>())
        ("config",   "Path to config file", cxxopts::value<std::string>()->default_value("powpool.conf"))
        ("d,debug",  "Enable debug logging")
        ("v,version", "Show version and exit")
        ("h,help",    "Show help and exit");
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("powpool-coordinator v{}", POWPOOL_VERSION));
            pr.show_only = true;
            return pr;
        }
        CoordinatorConfig cfg;
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        if (!report(log, powpool::config::load_from_file(cfg, pr.config_path))) return pr;
        if (!report(log, powpool::config::apply_env_overrides(cfg))) return pr;

        if (result.count("port")) {
            std::string err;
            if (!powpool::config::parse_port(result["port"].as<std::string>(), cfg.port, err, true)) {
                log.error(fmt::format("--port: {}", err));
                return pr;
            }
        }
        if (result.count("password")) cfg.password = result["password"].as<std::string>();
        if (result.count("api-key"))  cfg.api_key  = result["api-key"].as<std::string>();
        if (result.count("api-url"))  cfg.api_url  = result["api-url"].as<std::string>();

        if (!report(log, powpool::config::validate_final(cfg))) return pr;
        pr.cfg = cfg;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

ParseResult<WorkerConfig> parse_worker(int argc, char** argv, powpool::logging::Logger& log) {
    ParseResult<WorkerConfig> pr;
    cxxopts::Options options("powpool-worker", "Hash worker for a powpool coordinator");
    options.add_options()
        ("server",   "Coordinator address (host:port)", cxxopts::value<std::string>())
        ("password", "Shared worker secret (env PASSWORD)", cxxopts::value<std::string>())
        ("config",   "Path to config file", cxxopts::value<std::string>()->default_value("powpool.conf"))
        ("d,debug",  "Enable debug logging")
        ("v,version", "Show version and exit")
        ("h,help",    "Show help and exit");
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("powpool-worker v{}", POWPOOL_VERSION));
            pr.show_only = true;
            return pr;
        }
        WorkerConfig cfg;
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        if (!report(log, powpool::config::load_from_file(cfg, pr.config_path))) return pr;
        if (!report(log, powpool::config::apply_env_overrides(cfg))) return pr;
        if (result.count("server"))   cfg.server   = result["server"].as<std::string>();
        if (result.count("password")) cfg.password = result["password"].as<std::string>();

        if (!report(log, powpool::config::validate_final(cfg))) return pr;
        pr.cfg = cfg;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace powpool::cli
