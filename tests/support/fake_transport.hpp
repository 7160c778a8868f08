#pragma once

#include <shardfetch/fetch/fetcher.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace shardfetch::test_support {

inline fetch::ByteBuffer bytesOf(std::string_view s) {
    fetch::ByteBuffer out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<std::byte>(c));
    return out;
}

inline std::string textOf(const fetch::ByteBuffer& b) {
    std::string out;
    out.reserve(b.size());
    for (auto c : b)
        out.push_back(static_cast<char>(c));
    return out;
}

// Scripted resource served by FakeTransport.
struct FakeResource {
    fetch::ByteBuffer body;
    std::optional<std::uint64_t> declaredLength; // defaults to body.size()
    bool omitLength{false};                      // probe reports SizeUnavailable
    std::optional<fetch::Error> probeError;
    bool throwOnLength{false};                   // length lookup throws a non-std type
    std::optional<fetch::Error> fetchError;      // returned after the first chunk
    bool declareTotal{true};                     // progress events carry totalBytes
    std::size_t chunkSize{4};
    std::chrono::milliseconds delay{0};          // per chunk
};

// In-process ITransport with call counters and a concurrency high-water mark.
class FakeTransport final : public fetch::ITransport {
public:
    void add(std::string id, FakeResource r) {
        std::lock_guard<std::mutex> lk(mutex_);
        resources_[std::move(id)] = std::move(r);
    }

    void add(std::string id, std::string_view body) {
        FakeResource r;
        r.body = bytesOf(body);
        add(std::move(id), std::move(r));
    }

    fetch::Expected<std::uint64_t> probeContentLength(std::string_view identifier) override {
        probeCalls.fetch_add(1);
        auto r = find(identifier);
        if (!r)
            return fetch::Error{fetch::ErrorCode::TransferFailed,
                                "no such resource: " + std::string(identifier)};
        if (r->throwOnLength)
            throw 7;
        if (r->probeError)
            return *r->probeError;
        if (r->omitLength)
            return fetch::Error{fetch::ErrorCode::SizeUnavailable, "Content-Length missing"};
        return r->declaredLength.value_or(r->body.size());
    }

    fetch::Expected<void> fetch(std::string_view identifier, const fetch::ChunkSink& sink,
                                const fetch::TransferProgressCallback& onProgress) override {
        fetchCalls.fetch_add(1);
        {
            std::lock_guard<std::mutex> lk(mutex_);
            startOrder_.emplace_back(identifier);
            ++fetchesById_[std::string(identifier)];
        }
        const auto now = inFlight.fetch_add(1) + 1;
        auto prev = maxInFlight.load();
        while (now > prev && !maxInFlight.compare_exchange_weak(prev, now)) {
        }
        struct Leave {
            std::atomic<int>& n;
            ~Leave() { n.fetch_sub(1); }
        } leave{inFlight};

        auto r = find(identifier);
        if (!r)
            return fetch::Error{fetch::ErrorCode::TransferFailed,
                                "no such resource: " + std::string(identifier)};

        const auto& body = r->body;
        const std::size_t step = std::max<std::size_t>(r->chunkSize, 1);
        std::size_t sent = 0;
        do {
            if (r->delay.count() > 0)
                std::this_thread::sleep_for(r->delay);
            const auto n = std::min(step, body.size() - sent);
            auto sr = sink(std::span<const std::byte>(body.data() + sent, n));
            if (!sr.ok())
                return sr.error();
            sent += n;
            if (onProgress) {
                fetch::TransferProgress p;
                p.loadedBytes = sent;
                if (r->declareTotal)
                    p.totalBytes = body.size();
                onProgress(p);
            }
            if (r->fetchError)
                return *r->fetchError;
        } while (sent < body.size());
        return fetch::Expected<void>{};
    }

    int fetchesOf(const std::string& id) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = fetchesById_.find(id);
        return it == fetchesById_.end() ? 0 : it->second;
    }

    std::vector<std::string> startOrder() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return startOrder_;
    }

    std::atomic<int> probeCalls{0};
    std::atomic<int> fetchCalls{0};
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};

private:
    std::optional<FakeResource> find(std::string_view id) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = resources_.find(std::string(id));
        if (it == resources_.end())
            return std::nullopt;
        return it->second;
    }

    mutable std::mutex mutex_;
    std::map<std::string, FakeResource> resources_;
    std::map<std::string, int> fetchesById_;
    std::vector<std::string> startOrder_;
};

} // namespace shardfetch::test_support
