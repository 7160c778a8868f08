/*
 * shardfetch/src/fetch/environment_check.cpp
 *
 * Boundary check run once at startup: the linked libcurl must initialise, speak
 * HTTP and HTTPS, and (where it says so) allow easy handles on several threads.
 */

#include <shardfetch/fetch/fetcher.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cstring>
#include <string>
#include <string_view>

namespace shardfetch::fetch {

// Defined in http_transport_curl.cpp
CURLcode ensureCurlGlobalInit();

namespace {

bool supportsProtocol(const curl_version_info_data* info, std::string_view name) {
    if (!info || !info->protocols)
        return false;
    for (auto p = info->protocols; *p; ++p) {
        if (name == *p)
            return true;
    }
    return false;
}

} // namespace

Expected<void> checkEnvironmentCompatible() {
    if (auto rc = ensureCurlGlobalInit(); rc != CURLE_OK) {
        return Error{ErrorCode::EnvironmentIncompatible,
                     std::string("libcurl failed to initialise: ") + curl_easy_strerror(rc)};
    }

    const auto* info = curl_version_info(CURLVERSION_NOW);
    if (!info) {
        return Error{ErrorCode::EnvironmentIncompatible, "libcurl reported no version info"};
    }
    spdlog::debug("libcurl {} ({})", info->version, info->ssl_version ? info->ssl_version : "no ssl");

    if (!supportsProtocol(info, "http")) {
        return Error{ErrorCode::EnvironmentIncompatible, "libcurl was built without HTTP"};
    }
    if (!supportsProtocol(info, "https") || (info->features & CURL_VERSION_SSL) == 0) {
        return Error{ErrorCode::EnvironmentIncompatible, "libcurl was built without TLS support"};
    }
#ifdef CURL_VERSION_THREADSAFE
    if ((info->features & CURL_VERSION_THREADSAFE) == 0) {
        return Error{ErrorCode::EnvironmentIncompatible,
                     "libcurl is not thread-safe; concurrent transfers are unsupported"};
    }
#endif
    return Expected<void>{};
}

} // namespace shardfetch::fetch
