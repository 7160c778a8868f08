#pragma once

#include <shardfetch/fetch/fetcher.hpp>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace shardfetch::fetch {

/**
 * Front for an optional ICacheStore. Without a backend every lookup misses and every
 * store is a no-op, so callers never branch on "is there a cache".
 */
class CacheGateway {
public:
    CacheGateway() = default;
    explicit CacheGateway(std::unique_ptr<ICacheStore> store) : store_(std::move(store)) {}

    CacheGateway(const CacheGateway&) = delete;
    CacheGateway& operator=(const CacheGateway&) = delete;
    CacheGateway(CacheGateway&&) noexcept = default;
    CacheGateway& operator=(CacheGateway&&) noexcept = default;

    [[nodiscard]] bool enabled() const noexcept { return store_ != nullptr; }

    // Backend read errors are treated as a miss.
    std::optional<ByteBuffer> lookup(std::string_view identifier) const;

    Expected<void> store(std::string_view identifier, std::span<const std::byte> bytes) const;

    [[nodiscard]] std::string nameSpace() const;

private:
    std::unique_ptr<ICacheStore> store_;
};

/**
 * Lower-case hex SHA-256 of the identifier; names cache entries on disk.
 */
[[nodiscard]] std::string cacheKeyDigest(std::string_view identifier);

} // namespace shardfetch::fetch
