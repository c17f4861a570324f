#include <powpool/coordinator/work_distributor.hpp>

#include <fmt/format.h>

#include <powpool/coordinator/partition.hpp>
#include <powpool/protocol/messages.hpp>

namespace powpool::coordinator {

bool WorkDistributor::solve(std::string_view difficulty_arg) {
    auto d = protocol::parse_int(difficulty_arg);
    if (!d) {
        log_.error(fmt::format("Invalid difficulty '{}': expected an integer", difficulty_arg));
        return false;
    }
    return solve(*d);
}

bool WorkDistributor::solve(int difficulty) {
    if (difficulty < kMinDifficulty || difficulty > kMaxDifficulty) {
        log_.error(fmt::format("Difficulty {} out of range ({}-{})", difficulty, kMinDifficulty, kMaxDifficulty));
        return false;
    }

    const auto workers = registry_.snapshot();
    if (workers.empty()) {
        log_.warn("No workers connected, nothing to solve with");
        return false;
    }

    const auto assignments = assign_nonces(workers.size());
    for (std::size_t i = 0; i < workers.size(); ++i) {
        registry_.send_to(workers[i], protocol::build_nonce(assignments[i].start, assignments[i].step));
    }

    std::string payload;
    try {
        payload = api_.generate_task(difficulty);
    } catch (const ApiError& e) {
        log_.error(fmt::format("Failed to generate work: {}", e.what()));
        return false;
    }
    log_.info(fmt::format("Generated work for difficulty {}: {}", difficulty, payload));

    board_.set(MiningTask{difficulty, payload, workers.size()});

    const auto payload_line = protocol::build_payload(payload);
    const auto solve_line = protocol::build_solve(difficulty);
    std::size_t started = 0;
    for (const auto& w : workers) {
        if (registry_.send_to(w, payload_line) && registry_.send_to(w, solve_line)) ++started;
    }
    log_.info(fmt::format("Solving difficulty {} on {}/{} workers", difficulty, started, workers.size()));
    return true;
}

} // namespace powpool::coordinator
