/*
 * shardfetch/src/fetch/cache_gateway.cpp
 *
 * CacheGateway (null-object front for an optional ICacheStore) and the
 * in-memory store used when no durable cache is wanted.
 *
 * - InMemoryCacheStore implements ICacheStore
 * - Thread-safe with shared_mutex (lookups share, stores exclude)
 */

#include <shardfetch/fetch/cache_gateway.hpp>

#include <spdlog/spdlog.h>

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace shardfetch::fetch {

std::optional<ByteBuffer> CacheGateway::lookup(std::string_view identifier) const {
    if (!store_)
        return std::nullopt;

    auto r = store_->lookup(identifier);
    if (!r.ok()) {
        spdlog::debug("Cache[{}]: lookup failed for '{}': {}", store_->nameSpace(), identifier,
                      r.error().message);
        return std::nullopt;
    }
    return std::move(r).value();
}

Expected<void> CacheGateway::store(std::string_view identifier,
                                   std::span<const std::byte> bytes) const {
    if (!store_)
        return Expected<void>{};
    return store_->store(identifier, bytes);
}

std::string CacheGateway::nameSpace() const {
    return store_ ? std::string(store_->nameSpace()) : std::string{};
}

namespace {

class InMemoryCacheStore final : public ICacheStore {
public:
    explicit InMemoryCacheStore(std::string nameSpace) : nameSpace_(std::move(nameSpace)) {}
    ~InMemoryCacheStore() override = default;

    Expected<std::optional<ByteBuffer>> lookup(std::string_view identifier) override {
        if (identifier.empty()) {
            return Error{ErrorCode::InvalidArgument, "CacheStore.lookup: empty identifier"};
        }

        std::shared_lock lk(mutex_);
        auto it = table_.find(std::string(identifier));
        if (it == table_.end()) {
            return std::optional<ByteBuffer>{std::nullopt};
        }
        return std::optional<ByteBuffer>{it->second};
    }

    Expected<void> store(std::string_view identifier, std::span<const std::byte> bytes) override {
        if (identifier.empty()) {
            return Error{ErrorCode::InvalidArgument, "CacheStore.store: empty identifier"};
        }

        {
            std::unique_lock lk(mutex_);
            table_[std::string(identifier)] = ByteBuffer(bytes.begin(), bytes.end());
        }

        spdlog::debug("Cache[{}]: stored '{}' ({} bytes, in-memory)", nameSpace_, identifier,
                      bytes.size());
        return Expected<void>{};
    }

    [[nodiscard]] std::string_view nameSpace() const noexcept override { return nameSpace_; }

private:
    std::string nameSpace_;
    std::unordered_map<std::string, ByteBuffer> table_;
    mutable std::shared_mutex mutex_;
};

} // namespace

std::unique_ptr<ICacheStore> makeInMemoryCacheStore(std::string nameSpace) {
    return std::make_unique<InMemoryCacheStore>(std::move(nameSpace));
}

} // namespace shardfetch::fetch
