#include <powpool/coordinator/worker_registry.hpp>

#include <algorithm>

#include <fmt/format.h>

namespace powpool::coordinator {

WorkerHandle::WorkerHandle(std::uint64_t id, std::shared_ptr<protocol::LineChannel> channel)
    : id_(id), endpoint_(channel->peer()), channel_(std::move(channel)) {}

void WorkerHandle::send(std::string_view line) {
    if (!connected_.load()) {
        throw protocol::ChannelError(fmt::format("worker {} is disconnected", endpoint_));
    }
    try {
        channel_->write_line(line);
    } catch (const protocol::ChannelError&) {
        connected_.store(false);
        throw;
    }
}

void WorkerHandle::close() {
    connected_.store(false);
    channel_->close();
}

WorkerHandlePtr WorkerRegistry::add(std::shared_ptr<protocol::LineChannel> channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto handle = std::make_shared<WorkerHandle>(next_id_++, std::move(channel));
    workers_.push_back(handle);
    return handle;
}

bool WorkerRegistry::remove(const WorkerHandlePtr& handle) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(workers_.begin(), workers_.end(), handle);
        if (it != workers_.end()) {
            workers_.erase(it);
            removed = true;
        }
    }
    if (removed) log_.info(fmt::format("Worker {} removed", handle->endpoint()));
    return removed;
}

std::vector<WorkerHandlePtr> WorkerRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_;
}

std::size_t WorkerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

std::size_t WorkerRegistry::broadcast(std::string_view line) {
    return send_all(snapshot(), line);
}

std::size_t WorkerRegistry::send_all(const std::vector<WorkerHandlePtr>& targets, std::string_view line) {
    std::size_t delivered = 0;
    for (const auto& handle : targets) {
        if (send_to(handle, line)) ++delivered;
    }
    return delivered;
}

bool WorkerRegistry::send_to(const WorkerHandlePtr& handle, std::string_view line) {
    try {
        handle->send(line);
        log_.debug(fmt::format("{} sent to worker {}", line, handle->endpoint()));
        return true;
    } catch (const protocol::ChannelError& e) {
        log_.error(fmt::format("Failed to send to worker {}: {}", handle->endpoint(), e.what()));
        handle->close();
        remove(handle);
        return false;
    }
}

void WorkerRegistry::close_all() {
    std::vector<WorkerHandlePtr> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing.swap(workers_);
    }
    for (const auto& handle : closing) handle->close();
}

} // namespace powpool::coordinator
