/*
 * shardfetch/src/fetch/http_headers.cpp
 *
 * Response header handling shared by the curl transport's header callback and
 * its length lookup. Kept free of libcurl so it can be tested on plain strings.
 */

#include "http_headers.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

namespace shardfetch::fetch::detail {

namespace {

// Local helper: lowercase copy
std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Case-insensitive starts_with
bool istarts_with(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

void parseHeaderLine(std::string_view line, HeaderParseContext& ctx) {
    // Strip CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // A new status line starts a new response (redirect hop); forget earlier headers.
    if (istarts_with(line, "HTTP/")) {
        ctx = HeaderParseContext{};
        auto sp = line.find(' ');
        if (sp != std::string_view::npos) {
            auto code = trim(line.substr(sp + 1, 3));
            long status = 0;
            auto res = std::from_chars(code.data(), code.data() + code.size(), status);
            if (res.ec == std::errc())
                ctx.lastStatus = status;
        }
        return;
    }

    // We expect "Key: Value"
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return;

    auto key = to_lower(trim(line.substr(0, colon)));
    if (key != "content-length")
        return;

    auto val = trim(line.substr(colon + 1));
    ctx.sawContentLength = true;
    ctx.rawContentLength = val;
    std::uint64_t tmp{0};
    const char* first = val.data();
    const char* last = val.data() + val.size();
    auto res = std::from_chars(first, last, tmp);
    if (res.ec == std::errc() && res.ptr == last && !val.empty()) {
        ctx.contentLength = tmp;
    } else {
        ctx.contentLength.reset();
    }
}

Expected<std::uint64_t> declaredLength(long httpStatus, const HeaderParseContext& ctx,
                                       std::string_view url) {
    if (httpStatus >= 400) {
        return Error{ErrorCode::SizeUnavailable, "HTTP error " + std::to_string(httpStatus) +
                                                     " for " + std::string(url)};
    }
    if (!ctx.sawContentLength) {
        return Error{ErrorCode::SizeUnavailable, "No Content-Length for " + std::string(url)};
    }
    if (!ctx.contentLength) {
        return Error{ErrorCode::SizeUnavailable,
                     "Content-Length is not a number: '" + ctx.rawContentLength.value_or("") + "'"};
    }
    return *ctx.contentLength;
}

} // namespace shardfetch::fetch::detail
