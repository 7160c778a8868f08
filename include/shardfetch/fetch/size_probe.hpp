#pragma once

#include <shardfetch/fetch/fetcher.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace shardfetch::fetch {

/**
 * Declared byte length of one part (headers only).
 */
Expected<std::uint64_t> probeSize(ITransport& transport, std::string_view identifier);

/**
 * Sum of the declared lengths of every part, probed with at most maxParallel threads.
 * Fails with the first probe error; remaining unprobed parts are skipped.
 */
Expected<std::uint64_t> probeTotalSize(ITransport& transport,
                                       const std::vector<ResourceIdentifier>& identifiers,
                                       int maxParallel);

} // namespace shardfetch::fetch
