#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace powpool::protocol {

// Wire verbs. Every message is one '\n'-terminated line: VERB [args...]
namespace verb {
inline constexpr std::string_view kWhoAreYou    = "WHO_ARE_YOU_?";
inline constexpr std::string_view kItsMe        = "ITS_ME";
inline constexpr std::string_view kGimmePassword = "GIMME_PASSWORD";
inline constexpr std::string_view kPasswd       = "PASSWD";
inline constexpr std::string_view kHelloYou     = "HELLO_YOU";
inline constexpr std::string_view kReady        = "READY";
inline constexpr std::string_view kOk           = "OK";
inline constexpr std::string_view kRejected     = "YOU_DONT_FOOL_ME";
inline constexpr std::string_view kNonce        = "NONCE";
inline constexpr std::string_view kPayload      = "PAYLOAD";
inline constexpr std::string_view kSolve        = "SOLVE";
inline constexpr std::string_view kProgress     = "PROGRESS";
inline constexpr std::string_view kTesting      = "TESTING";
inline constexpr std::string_view kNope         = "NOPE";
inline constexpr std::string_view kCancelled    = "CANCELLED";
inline constexpr std::string_view kFound        = "FOUND";
inline constexpr std::string_view kQuit         = "QUIT";
inline constexpr std::string_view kStatus       = "STATUS";
inline constexpr std::string_view kStatusOk     = "STATUS_OK";
} // namespace verb

struct Message {
    std::string verb;
    std::vector<std::string> args;  // space-separated tokens after the verb
    std::string rest;               // raw text after the first space
};

Message parse(std::string_view line);

// Worker -> coordinator report classification.
enum class ReportKind { Found, Testing, Nope, Ready, StatusOk, Unknown };
ReportKind classify_report(const Message& msg);

struct FoundReport {
    std::string hash;   // lowercase hex digest
    std::string nonce;  // hex of the nonce bytes
};
std::optional<FoundReport> parse_found(const Message& msg);

struct NonceRange {
    std::uint64_t start{0};
    std::uint64_t step{1};
};
// NONCE <start> <step>; step must be >= 1.
std::optional<NonceRange> parse_nonce(const Message& msg);

// Strict decimal parsers: whole token must be consumed, no sign for unsigned.
std::optional<int> parse_int(std::string_view text);
std::optional<std::uint64_t> parse_u64(std::string_view text);

std::string build_passwd(std::string_view secret);
std::string build_nonce(std::uint64_t start, std::uint64_t step);
std::string build_payload(std::string_view data);
std::string build_solve(int difficulty);
std::string build_found(std::string_view hash_hex, std::string_view nonce_hex);
std::string build_testing(std::string_view nonce_decimal);

} // namespace powpool::protocol
