#pragma once

#include <functional>
#include <ostream>
#include <string_view>

#include <powpool/coordinator/result_coordinator.hpp>
#include <powpool/coordinator/work_distributor.hpp>
#include <powpool/coordinator/worker_registry.hpp>
#include <powpool/logging/logger.hpp>

namespace powpool::coordinator {

// Operator console commands. Matching ignores case and surrounding whitespace.
class CommandRouter {
public:
    CommandRouter(WorkerRegistry& registry, WorkDistributor& distributor, ResultCoordinator& results,
                  std::ostream& out, powpool::logging::Logger& log,
                  std::function<void()> on_quit = {})
        : registry_(registry),
          distributor_(distributor),
          results_(results),
          out_(out),
          log_(log),
          on_quit_(std::move(on_quit)) {}

    // Runs one console line. Returns false once the console should stop.
    bool dispatch(std::string_view input);

    void print_help();
    void print_status();

private:
    void progress();
    void quit();

    WorkerRegistry& registry_;
    WorkDistributor& distributor_;
    ResultCoordinator& results_;
    std::ostream& out_;
    powpool::logging::Logger& log_;
    std::function<void()> on_quit_;
};

} // namespace powpool::coordinator
