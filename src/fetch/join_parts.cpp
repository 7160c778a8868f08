#include <shardfetch/fetch/fetcher.hpp>

#include <algorithm>
#include <numeric>

namespace shardfetch::fetch {

ByteBuffer joinParts(const std::vector<ByteBuffer>& parts) {
    const auto total = std::accumulate(
        parts.begin(), parts.end(), std::size_t{0},
        [](std::size_t acc, const ByteBuffer& part) { return acc + part.size(); });

    ByteBuffer out;
    out.reserve(total);
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

} // namespace shardfetch::fetch
