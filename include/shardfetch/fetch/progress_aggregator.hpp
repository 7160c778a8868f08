#pragma once

#include <shardfetch/fetch/fetcher.hpp>
#include <shardfetch/fetch/task_registry.hpp>

#include <cstdint>
#include <mutex>

namespace shardfetch::fetch {

/**
 * Folds per-task transfer progress into one (loaded, total) pair for the caller.
 * Emission is serialized so the caller sees a non-decreasing loaded value.
 */
class ProgressAggregator {
public:
    ProgressAggregator(TaskRegistry& registry, std::int64_t total,
                       AggregateProgressCallback callback)
        : registry_(registry), total_(total), callback_(std::move(callback)) {}

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    void onTaskProgress(Task& task, const TransferProgress& progress);

    [[nodiscard]] std::int64_t total() const noexcept { return total_; }
    [[nodiscard]] bool reporting() const noexcept { return static_cast<bool>(callback_); }

private:
    TaskRegistry& registry_;
    const std::int64_t total_;
    AggregateProgressCallback callback_;
    std::mutex emitMutex_;
};

} // namespace shardfetch::fetch
