#include "worker_group.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace shardfetch::fetch::detail {

WorkerGroup::WorkerGroup()
    : WorkerGroup([](std::function<void()> fn) { return std::thread(std::move(fn)); }) {}

WorkerGroup::WorkerGroup(Launcher launcher) : launcher_(std::move(launcher)) {}

WorkerGroup::~WorkerGroup() {
    join();
}

std::size_t WorkerGroup::start(std::size_t count, const Body& body) {
    try {
        // Reserved up front so push_back never reallocates with a running thread in hand.
        threads_.reserve(threads_.size() + count);
    } catch (const std::exception& ex) {
        spdlog::error("Cannot reserve {} worker slot(s): {}", count, ex.what());
        return threads_.size();
    }

    for (std::size_t i = 0; i < count; ++i) {
        try {
            threads_.push_back(launcher_([body, i]() { body(i); }));
        } catch (const std::exception& ex) {
            spdlog::warn("Started {} of {} worker thread(s): {}", i, count, ex.what());
            break;
        }
    }
    return threads_.size();
}

void WorkerGroup::join() {
    for (auto& t : threads_) {
        if (t.joinable())
            t.join();
    }
}

} // namespace shardfetch::fetch::detail
