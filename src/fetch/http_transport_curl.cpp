/*
 * http_transport_curl.cpp
 *
 * Notes
 * - Provides probeContentLength() and fetch() using the libcurl easy API, one easy
 *   handle per call so several worker threads can transfer at once.
 * - Honors timeout, TLS verify/CA, proxy, headers, user agent and redirects.
 * - The probe issues a plain GET and aborts as soon as the first body byte arrives,
 *   so only the response headers are transferred.
 * - fetch() reports progress per received chunk with the Content-Length this
 *   transfer declared (or none).
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <shardfetch/fetch/fetcher.hpp>

#include "http_headers.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace shardfetch::fetch {

using detail::HeaderParseContext;

// curl_global_init is not thread-safe; run it once before the first easy handle.
CURLcode ensureCurlGlobalInit() {
    static std::once_flag once;
    static CURLcode initResult = CURLE_OK;
    std::call_once(once, []() {
        initResult = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (initResult != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(initResult));
        }
    });
    return initResult;
}

// Map CURLcode to Error. Everything the network can do wrong is a failed transfer.
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    err.code = code == CURLE_OK ? ErrorCode::None : ErrorCode::TransferFailed;
    return err;
}

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    try {
        detail::parseHeaderLine(std::string_view(buffer, total),
                                *static_cast<HeaderParseContext*>(userdata));
    } catch (const std::exception& ex) {
        spdlog::warn("Header callback failed: {}", ex.what());
        return 0;
    }
    return total;
}

// Probe body callback: the headers are complete once the body starts; stop there.
struct ProbeContext {
    bool abortedAtBody{false};
};

static size_t probe_write_cb(char*, size_t, size_t, void* userdata) {
    if (userdata != nullptr) {
        static_cast<ProbeContext*>(userdata)->abortedAtBody = true;
    }
    return 0; // signal error to curl => CURLE_WRITE_ERROR
}

// Write sink context for fetch
struct WriteContext {
    const ChunkSink* sink{nullptr};
    const TransferProgressCallback* onProgress{nullptr};
    const HeaderParseContext* headers{nullptr};
    std::uint64_t downloaded{0};
    std::optional<Error> sinkError;
    std::optional<std::string> callbackException;
};

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    try {
        auto r = (ctx->sink && *ctx->sink)
                     ? (*ctx->sink)(bytes)
                     : Expected<void>{Error{ErrorCode::IoError, "No sink provided"}};
        if (!r.ok()) {
            ctx->sinkError = r.error();
            return 0; // Abort transfer
        }

        ctx->downloaded += static_cast<std::uint64_t>(total);
        if (ctx->onProgress && *ctx->onProgress) {
            TransferProgress ev;
            ev.loadedBytes = ctx->downloaded;
            ev.totalBytes = ctx->headers ? ctx->headers->contentLength : std::nullopt;
            (*ctx->onProgress)(ev);
        }
    } catch (const std::exception& ex) {
        // Exceptions must not unwind through libcurl.
        ctx->callbackException = ex.what();
        return 0;
    } catch (...) {
        ctx->callbackException = "non-standard exception";
        return 0;
    }

    return total;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, const TransportConfig& cfg) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(cfg.timeout.count(), 30000)));
    // Required for multi-threaded use (no SIGALRM based DNS timeouts)
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, cfg.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, cfg.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, cfg.tls.insecure ? 0L : 2L);
    if (!cfg.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, cfg.tls.caPath.c_str());
    }

    // Proxy
    if (cfg.proxy && !cfg.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, cfg.proxy->c_str());
    }

    if (!cfg.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, cfg.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

class CurlTransport final : public ITransport {
public:
    explicit CurlTransport(TransportConfig cfg) : cfg_(std::move(cfg)) { ensureCurlGlobalInit(); }
    ~CurlTransport() override = default;

    Expected<std::uint64_t> probeContentLength(std::string_view identifier) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::TransferFailed, "curl_easy_init failed"};
        }

        const std::string url(identifier);
        auto* list = build_header_list(cfg_.headers);
        HeaderParseContext hctx{};
        ProbeContext pctx{};

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, probe_write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &pctx);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        configure_common(curl, cfg_);

        CURLcode rc = curl_easy_perform(curl);
        long http_status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        // CURLE_WRITE_ERROR is our own early abort once headers are in.
        const bool headersComplete = rc == CURLE_OK || (rc == CURLE_WRITE_ERROR && pctx.abortedAtBody);
        if (!headersComplete) {
            return makeCurlError(rc, "probe(GET)");
        }
        return detail::declaredLength(http_status, hctx, url);
    }

    Expected<void> fetch(std::string_view identifier, const ChunkSink& sink,
                         const TransferProgressCallback& onProgress) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::TransferFailed, "curl_easy_init failed"};
        }

        const std::string url(identifier);
        curl_slist* list = build_header_list(cfg_.headers);

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        // Error statuses fail before their body reaches the sink
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

        // Header capture for the declared length of this transfer
        HeaderParseContext hctx{};
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.sink = &sink;
        wctx.onProgress = &onProgress;
        wctx.headers = &hctx;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);

        configure_common(curl, cfg_);

        CURLcode rc = curl_easy_perform(curl);

        long http_status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (wctx.callbackException) {
            return Error{ErrorCode::Unknown,
                         "Exception in transfer callback: " + *wctx.callbackException};
        }
        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetch(GET " + url + ")");
        }
        if (http_status >= 400) {
            return Error{ErrorCode::TransferFailed, "HTTP error " + std::to_string(http_status)};
        }

        // Final event; also covers empty bodies that never hit the write callback.
        if (onProgress) {
            TransferProgress ev;
            ev.loadedBytes = wctx.downloaded;
            ev.totalBytes = hctx.contentLength; // may be std::nullopt
            onProgress(ev);
        }

        return Expected<void>{}; // success
    }

private:
    TransportConfig cfg_;
};

std::unique_ptr<ITransport> makeCurlTransport(const TransportConfig& cfg) {
    return std::make_unique<CurlTransport>(cfg);
}

} // namespace shardfetch::fetch
