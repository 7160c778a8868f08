/*
 * shardfetch/src/fetch/size_probe.cpp
 *
 * Up-front size discovery for aggregate progress. Runs only when the caller asked
 * for progress; the summed total is fixed for the rest of the call.
 */

#include <shardfetch/fetch/size_probe.hpp>

#include "worker_group.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <exception>
#include <string>

namespace shardfetch::fetch {

Expected<std::uint64_t> probeSize(ITransport& transport, std::string_view identifier) {
    if (identifier.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty identifier"};
    }
    auto r = transport.probeContentLength(identifier);
    if (!r.ok()) {
        const auto& err = r.error();
        if (err.code == ErrorCode::SizeUnavailable || err.code == ErrorCode::TransferFailed)
            return err;
        return Error{ErrorCode::SizeUnavailable, err.message};
    }
    spdlog::debug("Probe '{}': {} bytes", identifier, r.value());
    return r.value();
}

Expected<std::uint64_t> probeTotalSize(ITransport& transport,
                                       const std::vector<ResourceIdentifier>& identifiers,
                                       int maxParallel) {
    if (identifiers.empty())
        return std::uint64_t{0};

    std::vector<std::uint64_t> sizes(identifiers.size(), 0);
    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex errorMutex;
    std::optional<Error> firstError;

    auto recordFailure = [&](const Error& err) {
        std::lock_guard<std::mutex> lk(errorMutex);
        if (!firstError)
            firstError = err;
        failed.store(true, std::memory_order_release);
    };

    auto worker = [&](std::size_t) {
        while (!failed.load(std::memory_order_acquire)) {
            const auto idx = next.fetch_add(1, std::memory_order_acq_rel);
            if (idx >= identifiers.size())
                return;
            Expected<std::uint64_t> r = [&]() -> Expected<std::uint64_t> {
                try {
                    return probeSize(transport, identifiers[idx]);
                } catch (const std::exception& ex) {
                    return Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()};
                } catch (...) {
                    return Error{ErrorCode::Unknown, "Non-standard exception reading size"};
                }
            }();
            if (!r.ok()) {
                recordFailure(r.error());
                return;
            }
            sizes[idx] = r.value();
        }
    };

    const auto threadCount = std::min<std::size_t>(
        static_cast<std::size_t>(std::max(maxParallel, 1)), identifiers.size());
    detail::WorkerGroup threads;
    if (threads.start(threadCount, worker) == 0) {
        recordFailure(Error{ErrorCode::Unknown, "No worker thread could be started"});
    }
    threads.join();

    if (firstError) {
        spdlog::debug("Size probe aborted: {}", firstError->message);
        return *firstError;
    }

    std::uint64_t total = 0;
    for (auto s : sizes)
        total += s;
    return total;
}

} // namespace shardfetch::fetch
