#include <powpool/config/loader.hpp>

#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <powpool/config/validator.hpp>

namespace powpool::config {

using Settings = std::map<std::string, std::string>;

static void load_key_value(Settings& out, const std::string& text) {
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        out[line.substr(0, eq)] = line.substr(eq + 1);
    }
}

static std::vector<std::string> load_json(Settings& out, const std::string& text) {
    std::vector<std::string> errs;
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            errs.push_back("config file must contain a JSON object");
            return errs;
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.value().is_string()) {
                out[it.key()] = it.value().get<std::string>();
            } else if (it.value().is_number_integer()) {
                out[it.key()] = std::to_string(it.value().get<long long>());
            } else {
                errs.push_back(fmt::format("'{}' must be a string", it.key()));
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        errs.push_back(fmt::format("Failed to read config file: {}", ex.what()));
    }
    return errs;
}

static std::vector<std::string> read_settings(Settings& out, const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) return {}; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    std::string text = buffer.str();
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return {};

    if (text[first_non_space] == '{') return load_json(out, text);
    load_key_value(out, text);
    return {};
}

static void apply_settings(CoordinatorConfig& cfg, const Settings& s, std::vector<std::string>& errs) {
    for (const auto& [key, val] : s) {
        if (key == "port") {
            std::string e;
            std::uint16_t port = 0;
            if (parse_port(val, port, e, true)) cfg.port = port;
            else errs.push_back(fmt::format("port: {}", e));
        }
        else if (key == "password") cfg.password = val;
        else if (key == "api_key") cfg.api_key = val;
        else if (key == "api_url") cfg.api_url = val;
    }
}

static void apply_settings(WorkerConfig& cfg, const Settings& s, std::vector<std::string>&) {
    for (const auto& [key, val] : s) {
        if (key == "server") cfg.server = val;
        else if (key == "password") cfg.password = val;
    }
}

template <typename Config>
static std::vector<std::string> load_into(Config& cfg, const std::string& path) {
    Settings s;
    auto errs = read_settings(s, path);
    if (!errs.empty()) return errs;
    apply_settings(cfg, s, errs);
    return errs;
}

std::vector<std::string> load_from_file(CoordinatorConfig& cfg, const std::string& path) {
    return load_into(cfg, path);
}

std::vector<std::string> load_from_file(WorkerConfig& cfg, const std::string& path) {
    return load_into(cfg, path);
}

std::vector<std::string> apply_env_overrides(CoordinatorConfig& cfg) {
    Settings s;
    if (const char* v = std::getenv("POWPOOL_PORT"))    s["port"] = v;
    if (const char* v = std::getenv("PASSWORD"))        s["password"] = v;
    if (const char* v = std::getenv("API_KEY"))         s["api_key"] = v;
    if (const char* v = std::getenv("POWPOOL_API_URL")) s["api_url"] = v;
    std::vector<std::string> errs;
    apply_settings(cfg, s, errs);
    return errs;
}

std::vector<std::string> apply_env_overrides(WorkerConfig& cfg) {
    Settings s;
    if (const char* v = std::getenv("POWPOOL_SERVER")) s["server"] = v;
    if (const char* v = std::getenv("PASSWORD"))       s["password"] = v;
    std::vector<std::string> errs;
    apply_settings(cfg, s, errs);
    return errs;
}

std::vector<std::string> validate_final(const CoordinatorConfig& cfg) {
    std::vector<std::string> errs;
    if (cfg.password.empty()) errs.push_back("password is required (PASSWORD)");
    if (cfg.api_key.empty()) errs.push_back("api key is required (API_KEY)");
    if (cfg.api_url.rfind("http://", 0) != 0 && cfg.api_url.rfind("https://", 0) != 0) {
        errs.push_back("api url must start with http:// or https://");
    }
    return errs;
}

std::vector<std::string> validate_final(const WorkerConfig& cfg) {
    std::vector<std::string> errs;
    if (cfg.password.empty()) errs.push_back("password is required (PASSWORD)");
    std::string e;
    if (!validate_host_port(cfg.server, e)) errs.push_back(fmt::format("server: {}", e));
    return errs;
}

} // namespace powpool::config
