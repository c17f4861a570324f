#include <powpool/coordinator/result_coordinator.hpp>

#include <fmt/format.h>

namespace powpool::coordinator {

FoundOutcome ResultCoordinator::on_found(const protocol::Message& report, const std::string& reporter) {
    auto found = protocol::parse_found(report);
    if (!found) {
        log_.warn(fmt::format("Malformed FOUND from {}: expected 2 arguments, got {}", reporter, report.args.size()));
        return FoundOutcome::Malformed;
    }

    std::lock_guard<std::mutex> lock(report_mutex_);
    auto task = board_.current();
    if (!task) {
        log_.info(fmt::format("Ignoring FOUND {} {} from {}: no active task", found->hash, found->nonce, reporter));
        return FoundOutcome::NoActiveTask;
    }

    log_.info(fmt::format("Worker {} found hash {} with nonce {}", reporter, found->hash, found->nonce));
    bool accepted = false;
    try {
        accepted = api_.validate(task->difficulty, found->nonce, found->hash);
    } catch (const ApiError& e) {
        log_.error(fmt::format("Failed to validate solution: {}", e.what()));
        return FoundOutcome::ApiFailure;
    }
    if (!accepted) {
        log_.warn(fmt::format("Solution from {} rejected, search continues", reporter));
        return FoundOutcome::Rejected;
    }

    log_.info(fmt::format("Solution from {} accepted", reporter));
    cancel_all();
    return FoundOutcome::Accepted;
}

std::size_t ResultCoordinator::cancel_all() {
    board_.clear();
    auto delivered = registry_.broadcast(protocol::verb::kCancelled);
    log_.debug(fmt::format("CANCELLED delivered to {} workers", delivered));
    return delivered;
}

} // namespace powpool::coordinator
