/*
 * shardfetch/src/fetch/single_part_fetcher.cpp
 *
 * One part, start to finish:
 * - Cache lookup; a hit returns immediately (no progress events, no transport call)
 * - Full-body transfer into memory, forwarding the transport's progress unchanged
 * - Best-effort write-back; a failed store is logged and the fetch still succeeds
 */

#include <shardfetch/fetch/single_part_fetcher.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <string>
#include <utility>

namespace shardfetch::fetch {

Expected<ByteBuffer> SinglePartFetcher::fetch(std::string_view identifier,
                                              const TransferProgressCallback& onProgress) const {
    if (identifier.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty identifier"};
    }

    if (auto cached = cache_.lookup(identifier)) {
        spdlog::debug("Cache[{}]: hit for '{}' ({} bytes)", cache_.nameSpace(), identifier,
                      cached->size());
        return std::move(*cached);
    }
    if (cache_.enabled()) {
        spdlog::debug("Cache[{}]: miss for '{}'", cache_.nameSpace(), identifier);
    }

    const auto started = std::chrono::steady_clock::now();
    ByteBuffer body;
    auto sink = [&body](std::span<const std::byte> data) -> Expected<void> {
        body.insert(body.end(), data.begin(), data.end());
        return Expected<void>{};
    };

    auto fr = transport_.fetch(identifier, sink, onProgress);
    if (!fr.ok()) {
        const auto& err = fr.error();
        // Every transport-level failure is a failed transfer from the scheduler's view.
        // Unknown is reserved for exceptions thrown by the caller's progress callback.
        if (err.code == ErrorCode::TransferFailed || err.code == ErrorCode::Unknown)
            return err;
        return Error{ErrorCode::TransferFailed, err.message};
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::debug("Transfer done for '{}': {} bytes in {} ms", identifier, body.size(),
                  elapsed.count());

    auto sr = cache_.store(identifier, body);
    if (!sr.ok()) {
        spdlog::warn("Cache[{}]: {} for '{}': {}", cache_.nameSpace(),
                     errorCodeName(ErrorCode::CacheWriteFailed), identifier, sr.error().message);
    }

    return body;
}

} // namespace shardfetch::fetch
