#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <powpool/logging/logger.hpp>
#include <powpool/protocol/line_channel.hpp>

namespace powpool::coordinator {

// One authenticated, connected worker.
class WorkerHandle {
public:
    WorkerHandle(std::uint64_t id, std::shared_ptr<protocol::LineChannel> channel);

    WorkerHandle(const WorkerHandle&) = delete;
    WorkerHandle& operator=(const WorkerHandle&) = delete;

    std::uint64_t id() const { return id_; }
    const std::string& endpoint() const { return endpoint_; }
    bool connected() const { return connected_.load(); }

    // Throws protocol::ChannelError; the handle is marked disconnected first.
    void send(std::string_view line);

    // Marks disconnected and shuts the channel down.
    void close();

    protocol::LineChannel& channel() { return *channel_; }

private:
    std::uint64_t id_;
    std::string endpoint_;
    std::shared_ptr<protocol::LineChannel> channel_;
    std::atomic<bool> connected_{true};
};

using WorkerHandlePtr = std::shared_ptr<WorkerHandle>;

/**
 * Live, authenticated workers in insertion order.
 *
 * Mutation and snapshotting share one mutex. Sends happen outside it against a
 * snapshot; a handle whose send fails is logged, closed and removed without
 * affecting delivery to the others.
 */
class WorkerRegistry {
public:
    explicit WorkerRegistry(powpool::logging::Logger& log) : log_(log) {}

    WorkerHandlePtr add(std::shared_ptr<protocol::LineChannel> channel);
    bool remove(const WorkerHandlePtr& handle);

    std::vector<WorkerHandlePtr> snapshot() const;
    std::size_t size() const;
    bool empty() const { return size() == 0; }

    // Sends to every handle registered at call time. Returns the number of successful deliveries.
    std::size_t broadcast(std::string_view line);

    // Sends to a previously taken snapshot.
    std::size_t send_all(const std::vector<WorkerHandlePtr>& targets, std::string_view line);

    // Returns false (and drops the handle) when the write fails.
    bool send_to(const WorkerHandlePtr& handle, std::string_view line);

    // Closes every connection and empties the registry.
    void close_all();

private:
    powpool::logging::Logger& log_;
    mutable std::mutex mutex_;
    std::vector<WorkerHandlePtr> workers_;
    std::uint64_t next_id_{1};
};

} // namespace powpool::coordinator
