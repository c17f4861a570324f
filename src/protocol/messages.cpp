#include <powpool/protocol/messages.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <fmt/format.h>

namespace powpool::protocol {

Message parse(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.remove_suffix(1);

    Message msg;
    auto space = line.find(' ');
    msg.verb = std::string(line.substr(0, space));
    if (space == std::string_view::npos) return msg;

    msg.rest = std::string(line.substr(space + 1));
    std::size_t pos = space + 1;
    while (pos < line.size()) {
        auto next = line.find(' ', pos);
        auto end = next == std::string_view::npos ? line.size() : next;
        if (end > pos) msg.args.emplace_back(line.substr(pos, end - pos));
        pos = end + 1;
    }
    return msg;
}

ReportKind classify_report(const Message& msg) {
    if (msg.verb == verb::kFound) return ReportKind::Found;
    if (msg.verb == verb::kTesting) return ReportKind::Testing;
    if (msg.verb == verb::kNope) return ReportKind::Nope;
    if (msg.verb == verb::kReady) return ReportKind::Ready;
    if (msg.verb == verb::kStatusOk) return ReportKind::StatusOk;
    return ReportKind::Unknown;
}

std::optional<FoundReport> parse_found(const Message& msg) {
    if (msg.verb != verb::kFound || msg.args.size() != 2) return std::nullopt;
    return FoundReport{msg.args[0], msg.args[1]};
}

std::optional<NonceRange> parse_nonce(const Message& msg) {
    if (msg.verb != verb::kNonce || msg.args.size() != 2) return std::nullopt;
    auto start = parse_u64(msg.args[0]);
    auto step = parse_u64(msg.args[1]);
    if (!start || !step || *step == 0) return std::nullopt;
    return NonceRange{*start, *step};
}

static bool all_digits(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<int> parse_int(std::string_view text) {
    std::string_view digits = text;
    if (!digits.empty() && (digits.front() == '-' || digits.front() == '+')) digits.remove_prefix(1);
    if (!all_digits(digits)) return std::nullopt;
    try {
        return std::stoi(std::string(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<std::uint64_t> parse_u64(std::string_view text) {
    if (!all_digits(text)) return std::nullopt;
    try {
        return static_cast<std::uint64_t>(std::stoull(std::string(text)));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string build_passwd(std::string_view secret) {
    return fmt::format("{} {}", verb::kPasswd, secret);
}

std::string build_nonce(std::uint64_t start, std::uint64_t step) {
    return fmt::format("{} {} {}", verb::kNonce, start, step);
}

std::string build_payload(std::string_view data) {
    return fmt::format("{} {}", verb::kPayload, data);
}

std::string build_solve(int difficulty) {
    return fmt::format("{} {}", verb::kSolve, difficulty);
}

std::string build_found(std::string_view hash_hex, std::string_view nonce_hex) {
    return fmt::format("{} {} {}", verb::kFound, hash_hex, nonce_hex);
}

std::string build_testing(std::string_view nonce_decimal) {
    return fmt::format("{} {}", verb::kTesting, nonce_decimal);
}

} // namespace powpool::protocol
