#pragma once

#include <string_view>

#include <powpool/coordinator/mining_task.hpp>
#include <powpool/coordinator/work_api.hpp>
#include <powpool/coordinator/worker_registry.hpp>
#include <powpool/logging/logger.hpp>

namespace powpool::coordinator {

inline constexpr int kMinDifficulty = 0;
inline constexpr int kMaxDifficulty = 64;  // hex characters in a SHA-256 digest

/**
 * Starts a task across the current pool.
 *
 * One registry snapshot serves the whole step: its workers receive
 * NONCE i N, then PAYLOAD and SOLVE once the work service has answered.
 * A new solve replaces whatever task was active.
 */
class WorkDistributor {
public:
    WorkDistributor(WorkerRegistry& registry, WorkApi& api, TaskBoard& board,
                    powpool::logging::Logger& log)
        : registry_(registry), api_(api), board_(board), log_(log) {}

    // Parses the operator argument. Returns true when a task was sent out.
    bool solve(std::string_view difficulty_arg);
    bool solve(int difficulty);

private:
    WorkerRegistry& registry_;
    WorkApi& api_;
    TaskBoard& board_;
    powpool::logging::Logger& log_;
};

} // namespace powpool::coordinator
