#pragma once

#include <shardfetch/fetch/cache_gateway.hpp>
#include <shardfetch/fetch/fetcher.hpp>

#include <string_view>

namespace shardfetch::fetch {

/**
 * Fetch one part: cache first, transport on miss, best-effort write-back.
 * Holds references only; the owner keeps transport and cache alive.
 */
class SinglePartFetcher {
public:
    SinglePartFetcher(ITransport& transport, const CacheGateway& cache)
        : transport_(transport), cache_(cache) {}

    /**
     * onProgress is never invoked for a cache hit. Transport failures come back as
     * TransferFailed; cache write failures are logged and dropped.
     */
    Expected<ByteBuffer> fetch(std::string_view identifier,
                               const TransferProgressCallback& onProgress) const;

private:
    ITransport& transport_;
    const CacheGateway& cache_;
};

} // namespace shardfetch::fetch
