/*
 * shardfetch/src/fetch/resource_fetcher.cpp
 *
 * ResourceFetcher (bounded worker pool over a shared task registry):
 * - Optional size probe of every part when the caller wants progress; fails fast
 * - min(maxParallel, parts) worker threads, each claiming the next unstarted part
 *   in input order until none is left
 * - Per-part progress folded into one aggregate (loaded, total) callback
 * - A failing part stops only its own worker; the first error is reported after
 *   every worker has joined, alongside whatever parts completed
 *
 * NOTE:
 * - There is no cancellation: parts already claimed run to completion or failure.
 * - The transport's per-transfer total and the probed aggregate total are kept apart.
 */

#include <shardfetch/fetch/cache_gateway.hpp>
#include <shardfetch/fetch/fetcher.hpp>
#include <shardfetch/fetch/progress_aggregator.hpp>
#include <shardfetch/fetch/single_part_fetcher.hpp>
#include <shardfetch/fetch/size_probe.hpp>
#include <shardfetch/fetch/task_registry.hpp>

#include "worker_group.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shardfetch::fetch {

namespace {

// First failure wins; later ones are only logged.
class FirstErrorSlot {
public:
    void record(const Error& err) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!error_)
            error_ = err;
    }
    [[nodiscard]] std::optional<Error> take() {
        std::lock_guard<std::mutex> lk(mutex_);
        return std::move(error_);
    }

private:
    std::mutex mutex_;
    std::optional<Error> error_;
};

ResourcePayload shapePayload(std::vector<ByteBuffer> parts) {
    if (parts.size() == 1)
        return ResourcePayload{std::move(parts.front())};
    return ResourcePayload{std::move(parts)};
}

} // namespace

class ResourceFetcher final : public IResourceFetcher {
public:
    ResourceFetcher(FetcherConfig cfg, std::unique_ptr<ITransport> transport,
                    std::unique_ptr<ICacheStore> cache)
        : config_(std::move(cfg)), transport_(std::move(transport)), cache_(std::move(cache)) {
        if (!transport_)
            transport_ = makeCurlTransport(config_.transport);
    }

    FetchOutcome fetchResources(const std::vector<ResourceIdentifier>& identifiers,
                                int maxParallel,
                                const AggregateProgressCallback& onProgress) override {
        FetchOutcome outcome;
        if (identifiers.empty()) {
            return outcome;
        }
        if (std::any_of(identifiers.begin(), identifiers.end(),
                        [](const ResourceIdentifier& id) { return id.empty(); })) {
            outcome.error = Error{ErrorCode::InvalidArgument, "Empty identifier in request"};
            outcome.payload = shapePayload(std::vector<ByteBuffer>(identifiers.size()));
            outcome.completed.assign(identifiers.size(), false);
            return outcome;
        }

        const int parallel = std::max(maxParallel, 1);
        const auto started = std::chrono::steady_clock::now();

        // Aggregate total is fixed up front and never revised.
        std::int64_t total = kUnknownTotal;
        if (onProgress) {
            auto pr = probeTotalSize(*transport_, identifiers, parallel);
            if (!pr.ok()) {
                spdlog::warn("Size probe failed ({}): {}", errorCodeName(pr.error().code),
                             pr.error().message);
                outcome.error = pr.error();
                outcome.payload = shapePayload(std::vector<ByteBuffer>(identifiers.size()));
                outcome.completed.assign(identifiers.size(), false);
                return outcome;
            }
            total = static_cast<std::int64_t>(pr.value());
        }

        TaskRegistry registry(identifiers);
        ProgressAggregator aggregator(registry, total, onProgress);
        SinglePartFetcher single(*transport_, cache_);
        FirstErrorSlot firstError;

        const auto workerCount =
            std::min<std::size_t>(static_cast<std::size_t>(parallel), registry.size());
        spdlog::debug("Fetching {} part(s) with {} worker(s), total={}", registry.size(),
                      workerCount, total);

        detail::WorkerGroup workers;
        const auto running = workers.start(workerCount, [&](std::size_t i) {
            runWorker(i, registry, aggregator, single, firstError);
        });
        if (running == 0) {
            firstError.record(Error{ErrorCode::Unknown, "No worker thread could be started"});
        }
        workers.join();

        outcome.error = firstError.take();
        outcome.completed.reserve(registry.size());
        for (std::size_t i = 0; i < registry.size(); ++i) {
            outcome.completed.push_back(registry.at(i).completed());
        }
        outcome.payload = shapePayload(registry.finalResults());

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (outcome.ok()) {
            spdlog::info("Fetched {} part(s) in {} ms", identifiers.size(), elapsed.count());
        } else {
            spdlog::info("Fetch of {} part(s) incomplete after {} ms: {}", identifiers.size(),
                         elapsed.count(), outcome.error->message);
        }
        return outcome;
    }

    FetchOutcome fetchResource(const ResourceIdentifier& identifier,
                               const AggregateProgressCallback& onProgress) override {
        return fetchResources(std::vector<ResourceIdentifier>{identifier}, config_.maxParallel,
                              onProgress);
    }

    [[nodiscard]] FetcherConfig config() const override { return config_; }

private:
    static void runWorker(std::size_t workerIndex, TaskRegistry& registry,
                          ProgressAggregator& aggregator, const SinglePartFetcher& single,
                          FirstErrorSlot& firstError) {
        while (Task* task = registry.claimNext()) {
            spdlog::debug("Worker {} claimed '{}'", workerIndex, task->identifier());

            Expected<ByteBuffer> r = [&]() -> Expected<ByteBuffer> {
                try {
                    return single.fetch(task->identifier(),
                                        [&aggregator, task](const TransferProgress& p) {
                                            aggregator.onTaskProgress(*task, p);
                                        });
                } catch (const std::exception& ex) {
                    return Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()};
                } catch (...) {
                    return Error{ErrorCode::Unknown, "Non-standard exception while fetching part"};
                }
            }();

            if (!r.ok()) {
                spdlog::warn("Worker {} stopping: '{}' failed ({}): {}", workerIndex,
                             task->identifier(), errorCodeName(r.error().code),
                             r.error().message);
                firstError.record(r.error());
                return;
            }
            registry.complete(*task, std::move(r).value());
        }
        spdlog::debug("Worker {} found no unclaimed part; exiting", workerIndex);
    }

    FetcherConfig config_;
    std::unique_ptr<ITransport> transport_;
    CacheGateway cache_;
};

std::unique_ptr<IResourceFetcher>
makeResourceFetcherWithDependencies(const FetcherConfig& cfg, std::unique_ptr<ITransport> transport,
                                    std::unique_ptr<ICacheStore> cache) {
    return std::make_unique<ResourceFetcher>(cfg, std::move(transport), std::move(cache));
}

std::unique_ptr<IResourceFetcher> makeResourceFetcher(const FetcherConfig& cfg) {
    std::unique_ptr<ICacheStore> cache;
    if (cfg.cache.enabled && !cfg.cache.directory.empty()) {
        cache = makeFileCacheStore(cfg.cache.directory, cfg.cache.nameSpace);
    } else {
        spdlog::debug("Cache disabled; every part goes to the network");
    }
    return makeResourceFetcherWithDependencies(cfg, makeCurlTransport(cfg.transport),
                                               std::move(cache));
}

} // namespace shardfetch::fetch
