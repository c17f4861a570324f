#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>

#include <asio/io_context.hpp>

#include <powpool/config/types.hpp>
#include <powpool/coordinator/connection_listener.hpp>
#include <powpool/coordinator/mining_task.hpp>
#include <powpool/coordinator/result_coordinator.hpp>
#include <powpool/coordinator/work_api.hpp>
#include <powpool/coordinator/work_distributor.hpp>
#include <powpool/coordinator/worker_registry.hpp>
#include <powpool/logging/logger.hpp>

namespace powpool::coordinator {

// Owns the coordinator's components and runs the operator console.
class Coordinator {
public:
    Coordinator(powpool::config::CoordinatorConfig cfg, std::unique_ptr<WorkApi> api,
                powpool::logging::Logger& log);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Throws protocol::ChannelError if the port cannot be bound.
    void start();
    void stop();

    // Reads commands until quit or end of input. Returns the process exit status.
    int run_console(std::istream& in, std::ostream& out);

    std::uint16_t port() const { return listener_.port(); }
    WorkerRegistry& registry() { return registry_; }
    TaskBoard& board() { return board_; }

private:
    // Declared first: sockets created on it must be destroyed before it.
    asio::io_context ioc_;
    powpool::config::CoordinatorConfig cfg_;
    std::unique_ptr<WorkApi> api_;
    powpool::logging::Logger& log_;
    TaskBoard board_;
    WorkerRegistry registry_;
    WorkDistributor distributor_;
    ResultCoordinator results_;
    ConnectionListener listener_;
};

} // namespace powpool::coordinator
