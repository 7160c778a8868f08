#pragma once

#include <shardfetch/fetch/fetcher.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace shardfetch::fetch::detail {

// Response headers seen so far for the current hop of one transfer.
struct HeaderParseContext {
    long lastStatus{0};
    bool sawContentLength{false};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::string> rawContentLength{};
};

// Feed one raw header line as delivered by libcurl (CRLF optional). A status
// line ("HTTP/...") starts a new response and clears everything seen before it.
void parseHeaderLine(std::string_view line, HeaderParseContext& ctx);

// Turn the final hop's status and headers into a declared body length.
// HTTP >= 400, a missing Content-Length, and a non-numeric one all map to
// SizeUnavailable.
Expected<std::uint64_t> declaredLength(long httpStatus, const HeaderParseContext& ctx,
                                       std::string_view url);

} // namespace shardfetch::fetch::detail
