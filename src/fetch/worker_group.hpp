#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace shardfetch::fetch::detail {

// Owns a set of worker threads and joins them on destruction. Threads that
// could not be created are skipped; the ones already running are still joined.
class WorkerGroup {
public:
    using Body = std::function<void(std::size_t)>;
    using Launcher = std::function<std::thread(std::function<void()>)>;

    WorkerGroup();
    explicit WorkerGroup(Launcher launcher);
    ~WorkerGroup();

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    // Runs body(0) .. body(count - 1) on their own threads. Stops at the first
    // thread that fails to start and returns how many are running.
    std::size_t start(std::size_t count, const Body& body);

    void join();

    [[nodiscard]] std::size_t size() const { return threads_.size(); }

private:
    Launcher launcher_;
    std::vector<std::thread> threads_;
};

} // namespace shardfetch::fetch::detail
