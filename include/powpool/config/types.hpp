#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace powpool::config {

inline constexpr std::uint16_t kDefaultPort = 1337;
inline constexpr const char* kDefaultApiUrl = "https://projet-raizo-idmc.netlify.app/.netlify/functions";

struct CoordinatorConfig {
    std::uint16_t port{kDefaultPort};
    std::string password;
    std::string api_key;
    std::string api_url{kDefaultApiUrl};
};

struct WorkerConfig {
    std::string server{"localhost:1337"};
    std::string password;
};

template <typename Config>
struct ParseResult {
    std::optional<Config> cfg;  // present when valid and ready to run
    std::string config_path{"powpool.conf"};
    bool show_only{false};      // true if --help/--version was printed
    bool debug{false};          // true if --debug was passed on CLI
};

} // namespace powpool::config
