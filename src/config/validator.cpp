#include <powpool/config/validator.hpp>

#include <algorithm>
#include <cctype>

namespace powpool::config {

bool is_valid_hostname(const std::string& host, std::string& err) {
    if (host.empty()) { err = "hostname is empty"; return false; }
    if (host.size() > 253) { err = "hostname too long (>253)"; return false; }
    std::size_t start = 0;
    while (start < host.size()) {
        auto dot = host.find('.', start);
        std::size_t end = (dot == std::string::npos) ? host.size() : dot;
        std::size_t len = end - start;
        if (len == 0) { err = "hostname has an empty label"; return false; }
        if (len > 63) { err = "hostname label too long (>63)"; return false; }
        if (host[start] == '-' || host[end-1] == '-') { err = "hostname label cannot start or end with '-'"; return false; }
        for (std::size_t i = start; i < end; ++i) {
            char c = host[i];
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-')) {
                err = "hostname contains invalid characters"; return false; }
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return true;
}

bool parse_port(const std::string& text, std::uint16_t& port, std::string& err, bool allow_zero) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        err = "port must contain digits only"; return false; }
    unsigned long value = 0;
    try { value = std::stoul(text); } catch (const std::exception&) { err = "invalid port"; return false; }
    if ((value == 0 && !allow_zero) || value > 65535UL) {
        err = "port out of range (1-65535)"; return false; }
    port = static_cast<std::uint16_t>(value);
    return true;
}

bool validate_host_port(const std::string& url, std::string& err) {
    auto pos = url.rfind(':');
    if (pos == std::string::npos || pos == url.size() - 1) {
        err = "address must be in the form host:port"; return false; }
    std::string host = url.substr(0, pos);
    std::uint16_t port = 0;
    if (!parse_port(url.substr(pos + 1), port, err)) return false;
    if (!is_valid_hostname(host, err)) return false;
    return true;
}

void split_host_port(const std::string& url, std::string& host, std::string& port) {
    auto pos = url.rfind(':');
    host = url.substr(0, pos);
    port = pos == std::string::npos ? std::string{} : url.substr(pos + 1);
}

} // namespace powpool::config
