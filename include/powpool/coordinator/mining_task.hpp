#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace powpool::coordinator {

struct MiningTask {
    int difficulty{0};
    std::string payload;
    std::size_t worker_count{0};  // partition size N at assignment time
};

// Holds the single active task. Replaced by a new solve, cleared by an
// accepted solution or an operator cancel.
class TaskBoard {
public:
    void set(MiningTask task) {
        std::lock_guard<std::mutex> lock(mutex_);
        task_ = std::move(task);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        task_.reset();
    }

    std::optional<MiningTask> current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return task_;
    }

    bool active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return task_.has_value();
    }

private:
    mutable std::mutex mutex_;
    std::optional<MiningTask> task_;
};

} // namespace powpool::coordinator
