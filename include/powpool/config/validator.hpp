#pragma once

#include <cstdint>
#include <string>

namespace powpool::config {

// Validates hostname (RFC-ish light rules) and returns error in 'err' if invalid.
bool is_valid_hostname(const std::string& host, std::string& err);

// Validates url in form host:port, checks hostname and port range [1..65535].
bool validate_host_port(const std::string& url, std::string& err);

// Parses a decimal port. Accepts 0 only when allow_zero is set (ephemeral bind).
bool parse_port(const std::string& text, std::uint16_t& port, std::string& err, bool allow_zero = false);

// Splits "host:port" on the last ':'. Call validate_host_port first.
void split_host_port(const std::string& url, std::string& host, std::string& port);

} // namespace powpool::config
