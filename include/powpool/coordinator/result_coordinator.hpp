#pragma once

#include <mutex>
#include <string>

#include <powpool/coordinator/mining_task.hpp>
#include <powpool/coordinator/work_api.hpp>
#include <powpool/coordinator/worker_registry.hpp>
#include <powpool/logging/logger.hpp>
#include <powpool/protocol/messages.hpp>

namespace powpool::coordinator {

enum class FoundOutcome {
    Accepted,
    Rejected,
    NoActiveTask,
    Malformed,
    ApiFailure,
};

// Reconciles FOUND reports with the validation service. Reports are handled
// one at a time, so the first accepted candidate ends the task.
class ResultCoordinator {
public:
    ResultCoordinator(WorkerRegistry& registry, WorkApi& api, TaskBoard& board,
                      powpool::logging::Logger& log)
        : registry_(registry), api_(api), board_(board), log_(log) {}

    FoundOutcome on_found(const protocol::Message& report, const std::string& reporter);

    // Clears the active task and broadcasts CANCELLED. Returns delivered count.
    std::size_t cancel_all();

private:
    WorkerRegistry& registry_;
    WorkApi& api_;
    TaskBoard& board_;
    powpool::logging::Logger& log_;
    std::mutex report_mutex_;
};

} // namespace powpool::coordinator
