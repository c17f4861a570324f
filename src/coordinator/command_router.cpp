#include <powpool/coordinator/command_router.hpp>

#include <algorithm>
#include <cctype>
#include <string>

#include <fmt/format.h>

#include <powpool/protocol/messages.hpp>

namespace powpool::coordinator {

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

static std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool CommandRouter::dispatch(std::string_view input) {
    auto line = trim(input);
    if (line.empty()) return true;

    auto space = line.find_first_of(" \t");
    auto command = lower(line.substr(0, space));
    auto argument = space == std::string_view::npos ? std::string_view{} : trim(line.substr(space + 1));

    if (command == "status" && argument.empty()) {
        print_status();
    } else if (command == "solve") {
        distributor_.solve(argument);
    } else if (command == "cancel" && argument.empty()) {
        auto delivered = results_.cancel_all();
        out_ << fmt::format("Cancelled on {} workers.\n", delivered);
    } else if (command == "progress" && argument.empty()) {
        progress();
    } else if (command == "help" && argument.empty()) {
        print_help();
    } else if (command == "quit" && argument.empty()) {
        quit();
        return false;
    } else {
        out_ << "Unknown command: " << line << '\n';
    }
    out_.flush();
    return true;
}

void CommandRouter::print_help() {
    out_ << " - status      : display information about connected workers\n"
            " - solve <d>   : try to mine with given difficulty\n"
            " - cancel      : cancel a task\n"
            " - progress    : ask workers which nonce they are testing\n"
            " - help        : describe available commands\n"
            " - quit        : terminate pending work and quit\n";
}

void CommandRouter::print_status() {
    auto workers = registry_.snapshot();
    if (workers.empty()) {
        out_ << "No workers connected.\n";
        return;
    }
    out_ << fmt::format("{} worker(s) connected:\n", workers.size());
    for (const auto& w : workers) out_ << " - " << w->endpoint() << '\n';
}

void CommandRouter::progress() {
    auto delivered = registry_.broadcast(protocol::verb::kProgress);
    log_.debug(fmt::format("PROGRESS delivered to {} workers", delivered));
}

void CommandRouter::quit() {
    log_.info("Shutting down");
    registry_.broadcast(protocol::verb::kQuit);
    registry_.close_all();
    if (on_quit_) on_quit_();
}

} // namespace powpool::coordinator
