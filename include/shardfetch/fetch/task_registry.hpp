#pragma once

#include <shardfetch/fetch/fetcher.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace shardfetch::fetch {

/**
 * Per-identifier record. The claiming worker is the only writer of the counters and
 * the result; any worker may read the counters while aggregating.
 */
class Task {
public:
    explicit Task(ResourceIdentifier identifier) : identifier_(std::move(identifier)) {}

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    [[nodiscard]] const ResourceIdentifier& identifier() const noexcept { return identifier_; }
    [[nodiscard]] bool started() const noexcept { return started_.load(std::memory_order_acquire); }
    [[nodiscard]] bool completed() const noexcept {
        return completed_.load(std::memory_order_acquire);
    }
    [[nodiscard]] std::uint64_t bytesLoaded() const noexcept {
        return bytesLoaded_.load(std::memory_order_acquire);
    }
    // 0 until the transport declares a total for this transfer.
    [[nodiscard]] std::uint64_t bytesTotal() const noexcept {
        return bytesTotal_.load(std::memory_order_acquire);
    }
    // Only meaningful once completed() is true.
    [[nodiscard]] const ByteBuffer& result() const noexcept { return result_; }

private:
    friend class TaskRegistry;

    const ResourceIdentifier identifier_;
    ByteBuffer result_;
    std::atomic<bool> started_{false};
    std::atomic<bool> completed_{false};
    std::atomic<std::uint64_t> bytesLoaded_{0};
    std::atomic<std::uint64_t> bytesTotal_{0};
};

/**
 * Ordered arena of tasks, one per input identifier. Doubles as the work queue:
 * workers claim the first unstarted task in input order until none is left.
 */
class TaskRegistry {
public:
    explicit TaskRegistry(const std::vector<ResourceIdentifier>& identifiers);

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * Atomically mark the first unstarted task as started and return it.
     * nullptr once every task has been claimed.
     */
    Task* claimNext() noexcept;

    /**
     * Record transfer progress for a claimed task. Loaded bytes never go backwards.
     */
    void updateProgress(Task& task, std::uint64_t loaded, std::uint64_t total) noexcept;

    /**
     * Store the final bytes of a claimed task. Called once per task.
     */
    void complete(Task& task, ByteBuffer bytes);

    [[nodiscard]] std::uint64_t loadedSum() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return tasks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tasks_.empty(); }
    [[nodiscard]] const Task& at(std::size_t index) const { return tasks_.at(index); }

    /**
     * Move every task's buffer out, in input order. Call after all workers joined.
     */
    std::vector<ByteBuffer> finalResults();

private:
    std::deque<Task> tasks_;
};

} // namespace shardfetch::fetch
