#pragma once

/*
 * shardfetch - Public Types and Fetcher Interfaces (C++20)
 *
 * This header defines the public data types and abstract interfaces for the
 * multi-part resource fetcher. It intentionally contains no implementation details.
 *
 * Design principles:
 * - One logical resource may be split across several parts (one identifier per part)
 * - Cache first: a part found in the injected cache never touches the network
 * - Bounded concurrency: at most maxParallel worker threads claim parts from a shared registry
 * - Aggregated progress: one (loaded, total) pair across every part of the call
 * - Clear separation of concerns (transport, cache store, registry, scheduler)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace shardfetch::fetch {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Canonical error codes for fetch operations.
 * Note: Not a std::error_code category to keep this header implementation-free.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    SizeUnavailable,  // a part's length could not be determined ahead of transfer
    TransferFailed,   // network-level failure while transferring a part
    CacheWriteFailed, // never surfaced by the fetcher; logged and dropped
    CacheReadFailed,
    EnvironmentIncompatible,
    IoError,
    Unknown
};

/**
 * Stable, lower-case name for an error code (logs and JSON output).
 */
constexpr const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::SizeUnavailable: return "size_unavailable";
        case ErrorCode::TransferFailed: return "transfer_failed";
        case ErrorCode::CacheWriteFailed: return "cache_write_failed";
        case ErrorCode::CacheReadFailed: return "cache_read_failed";
        case ErrorCode::EnvironmentIncompatible: return "environment_incompatible";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * Aggregate total reported when progress was requested without a size probe.
 */
inline constexpr std::int64_t kUnknownTotal = -1;

/**
 * Default cache namespace.
 */
inline constexpr std::string_view kDefaultCacheNamespace = "shardfetch_cache";

// ===================
// Small data objects
// ===================

using ResourceIdentifier = std::string;
using ByteBuffer = std::vector<std::byte>;

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Transport configuration (applies to every request issued by one fetcher).
 */
struct TransportConfig {
    std::chrono::milliseconds timeout{60000};
    bool followRedirects{true};
    std::optional<std::string> proxy;
    std::string userAgent{"shardfetch/1.0"};
    std::vector<Header> headers;
    TlsConfig tls{};
};

/**
 * Cache configuration. An empty directory or enabled=false means "no cache backend".
 */
struct CacheConfig {
    bool enabled{true};
    std::filesystem::path directory;
    std::string nameSpace{kDefaultCacheNamespace};
};

/**
 * Fetcher default configuration.
 */
struct FetcherConfig {
    int maxParallel{4};
    TransportConfig transport{};
    CacheConfig cache{};
};

/**
 * Streaming progress event for a single transfer. The total is whatever the
 * transport declared for this transfer (possibly nothing).
 */
struct TransferProgress {
    std::uint64_t loadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using TransferProgressCallback = std::function<void(const TransferProgress&)>;
using ChunkSink = std::function<Expected<void>(std::span<const std::byte>)>;

/**
 * Aggregate progress across all parts of one call: (sum of bytes loaded, probed total).
 * May be invoked from any worker thread; invocations never overlap.
 */
using AggregateProgressCallback = std::function<void(std::int64_t loaded, std::int64_t total)>;

// ==============
// Call results
// ==============

/**
 * A single buffer when exactly one identifier was requested, otherwise one buffer
 * per identifier in input order.
 */
using ResourcePayload = std::variant<ByteBuffer, std::vector<ByteBuffer>>;

/**
 * Outcome of fetchResources(). On failure the payload still holds whatever parts
 * completed; parts that did not complete are empty buffers.
 */
struct FetchOutcome {
    ResourcePayload payload{std::vector<ByteBuffer>{}};
    std::optional<Error> error{};
    // One flag per input identifier, in input order. A completed part may still be
    // empty when the resource itself has no bytes.
    std::vector<bool> completed{};

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
    [[nodiscard]] bool isSingle() const noexcept {
        return std::holds_alternative<ByteBuffer>(payload);
    }

    /**
     * Flatten the payload into an ordered list regardless of its shape.
     */
    [[nodiscard]] std::vector<ByteBuffer> takeParts() && {
        if (auto* single = std::get_if<ByteBuffer>(&payload)) {
            std::vector<ByteBuffer> out;
            out.push_back(std::move(*single));
            return out;
        }
        return std::move(std::get<std::vector<ByteBuffer>>(payload));
    }
};

// ==========================
// Service interface classes
// ==========================

/**
 * Transport abstraction (libcurl-based implementation will satisfy this).
 * Implementations must be safe to call from several threads at once.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * Read only the response headers for `identifier` and return the declared
     * Content-Length. The request is abandoned before any body is transferred.
     * SizeUnavailable when the length is missing or malformed, TransferFailed on
     * network failure.
     */
    virtual Expected<std::uint64_t> probeContentLength(std::string_view identifier) = 0;

    /**
     * Transfer the full body of `identifier`, streaming chunks to `sink`.
     * The sink and onProgress are called on the calling thread.
     */
    virtual Expected<void> fetch(std::string_view identifier, const ChunkSink& sink,
                                 const TransferProgressCallback& onProgress) = 0;
};

/**
 * Named key/value blob store keyed by identifier (verbatim).
 * Implementations must be safe for concurrent use.
 */
class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    /**
     * std::nullopt on miss. An error means the backend could not be read at all.
     */
    virtual Expected<std::optional<ByteBuffer>> lookup(std::string_view identifier) = 0;
    virtual Expected<void> store(std::string_view identifier, std::span<const std::byte> bytes) = 0;

    [[nodiscard]] virtual std::string_view nameSpace() const noexcept = 0;
};

/**
 * Resource fetcher abstraction (orchestrates probe/registry/workers/cache).
 */
class IResourceFetcher {
public:
    virtual ~IResourceFetcher() = default;

    /**
     * Fetch every identifier with at most maxParallel workers.
     * onProgress is optional; when set every part is size-probed first.
     */
    virtual FetchOutcome fetchResources(const std::vector<ResourceIdentifier>& identifiers,
                                        int maxParallel,
                                        const AggregateProgressCallback& onProgress = {}) = 0;

    /**
     * Single identifier using the configured default parallelism.
     */
    virtual FetchOutcome fetchResource(const ResourceIdentifier& identifier,
                                       const AggregateProgressCallback& onProgress = {}) = 0;

    [[nodiscard]] virtual FetcherConfig config() const = 0;
};

// ======================
// Utility helpers
// ======================

/**
 * Concatenate ordered part buffers into one contiguous buffer.
 */
[[nodiscard]] ByteBuffer joinParts(const std::vector<ByteBuffer>& parts);

/**
 * Boundary check run once by the surrounding application before any fetch.
 * EnvironmentIncompatible when the linked transport cannot serve concurrent HTTP(S).
 */
Expected<void> checkEnvironmentCompatible();

// ======================
// Factories
// ======================

std::unique_ptr<ITransport> makeCurlTransport(const TransportConfig& cfg);
std::unique_ptr<ICacheStore> makeInMemoryCacheStore(std::string nameSpace = std::string{
                                                        kDefaultCacheNamespace});
std::unique_ptr<ICacheStore> makeFileCacheStore(const std::filesystem::path& directory,
                                                std::string nameSpace = std::string{
                                                    kDefaultCacheNamespace});

/**
 * Build a fetcher with explicit collaborators. A null cache means "no cache backend";
 * a null transport falls back to the curl transport built from cfg.transport.
 */
std::unique_ptr<IResourceFetcher>
makeResourceFetcherWithDependencies(const FetcherConfig& cfg, std::unique_ptr<ITransport> transport,
                                    std::unique_ptr<ICacheStore> cache);

/**
 * Default fetcher: curl transport plus a file cache when cfg.cache is enabled.
 */
std::unique_ptr<IResourceFetcher> makeResourceFetcher(const FetcherConfig& cfg);

} // namespace shardfetch::fetch
