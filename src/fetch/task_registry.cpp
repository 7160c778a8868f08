/*
 * shardfetch/src/fetch/task_registry.cpp
 *
 * Task arena shared by the worker threads of one fetchResources() call.
 * - claimNext() is a linear scan in input order with a compare-and-swap on each
 *   task's started flag, so two workers can never own the same task
 * - Progress counters are atomics written only by the owning worker
 */

#include <shardfetch/fetch/task_registry.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace shardfetch::fetch {

TaskRegistry::TaskRegistry(const std::vector<ResourceIdentifier>& identifiers) {
    for (const auto& id : identifiers) {
        tasks_.emplace_back(id);
    }
}

Task* TaskRegistry::claimNext() noexcept {
    for (auto& task : tasks_) {
        if (task.started_.load(std::memory_order_relaxed))
            continue;
        bool expected = false;
        if (task.started_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return &task;
        }
    }
    return nullptr;
}

void TaskRegistry::updateProgress(Task& task, std::uint64_t loaded, std::uint64_t total) noexcept {
    // Single writer per task: a plain max against the current value is enough.
    if (loaded > task.bytesLoaded_.load(std::memory_order_relaxed)) {
        task.bytesLoaded_.store(loaded, std::memory_order_release);
    }
    task.bytesTotal_.store(total, std::memory_order_release);
}

void TaskRegistry::complete(Task& task, ByteBuffer bytes) {
    if (task.completed_.load(std::memory_order_acquire)) {
        spdlog::warn("TaskRegistry: '{}' completed twice; keeping first result", task.identifier_);
        return;
    }
    task.result_ = std::move(bytes);
    task.completed_.store(true, std::memory_order_release);
}

std::uint64_t TaskRegistry::loadedSum() const noexcept {
    std::uint64_t sum = 0;
    for (const auto& task : tasks_) {
        sum += task.bytesLoaded_.load(std::memory_order_acquire);
    }
    return sum;
}

std::vector<ByteBuffer> TaskRegistry::finalResults() {
    std::vector<ByteBuffer> out;
    out.reserve(tasks_.size());
    for (auto& task : tasks_) {
        out.push_back(std::move(task.result_));
    }
    return out;
}

} // namespace shardfetch::fetch
