/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Implements IHttpAdapter::stream() with the libcurl easy API, one handle per call.
 * - Honors connect/idle timeouts, TLS verify/CA, redirects and user agent.
 * - Response head is delivered once, from the final response after redirects, before the
 *   first body chunk (or after perform() for an empty body).
 * - Cooperative cancellation is polled before every chunk and from the transfer-info
 *   callback, so an idle or still-connecting stream is also released promptly.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <courier/transfer/transfer.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace courier::transfer {

namespace {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

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

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        case CURLE_OUT_OF_MEMORY:
        case CURLE_FAILED_INIT:
            err.code = ErrorCode::Unknown;
            break;
        default:
            // DNS, connect, TLS, timeouts, truncated bodies: all surface as network failures
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

// Shared state for header/write/xferinfo callbacks of a single stream() call
struct StreamContext {
    CURL* curl{nullptr};
    const HeadCallback* onHead{nullptr};
    const ChunkSink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};

    ResponseHead head;
    bool headDelivered{false};
    bool cancelRequested{false};
    std::optional<Error> callbackError;

    bool cancelled() {
        if (!cancelRequested && *shouldCancel && (*shouldCancel)())
            cancelRequested = true;
        return cancelRequested;
    }

    bool deliverHead() {
        if (headDelivered)
            return !callbackError.has_value();
        headDelivered = true;
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        head.status = status;
        if (*onHead) {
            auto r = (*onHead)(head);
            if (!r.ok()) {
                callbackError = r.error();
                return false;
            }
        }
        return true;
    }
};

// CURL header callback. A new status line starts a fresh header set (redirect hops, 1xx).
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<StreamContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    if (istarts_with(line, "HTTP/")) {
        ctx->head.headers.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    ctx->head.headers.push_back(Header{trim(line.substr(0, colon)), trim(line.substr(colon + 1))});
    return total;
}

// CURL write callback: head first, then cancellation check, then the sink
size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<StreamContext*>(userdata);
    if (!ctx->deliverHead())
        return 0;
    if (total == 0)
        return 0;

    if (ctx->cancelled())
        return 0; // signal error to curl => CURLE_WRITE_ERROR

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r.ok()) {
        ctx->callbackError = r.error();
        return 0;
    }
    return total;
}

int xferinfo_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<StreamContext*>(clientp);
    return ctx->cancelled() ? 1 : 0;
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, const HttpOptions& opts) {
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    // Timeouts: connect bound plus an idle bound (< 1 B/s for idleTimeout), never a total cap
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(opts.connectTimeout.count()));
    const auto idleSeconds = std::max<long>(
        1, static_cast<long>(
               std::chrono::duration_cast<std::chrono::seconds>(opts.idleTimeout).count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, idleSeconds);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, opts.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, opts.maxRedirects);
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
#endif

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, opts.tlsInsecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, opts.tlsInsecure ? 0L : 2L);
    if (!opts.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, opts.caPath.c_str());
    }

    if (!opts.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, opts.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensureCurlInitialized(); }
    ~CurlHttpAdapter() override = default;

    Expected<void> stream(std::string_view url, const HttpOptions& options,
                          const HeadCallback& onHead, const ChunkSink& sink,
                          const ShouldCancel& shouldCancel) override {
        if (!sink) {
            return Error{ErrorCode::InvalidArgument, "stream: no sink provided"};
        }

        CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        StreamContext ctx;
        ctx.curl = curl.get();
        ctx.onHead = &onHead;
        ctx.sink = &sink;
        ctx.shouldCancel = &shouldCancel;

        const std::string urlStr(url);
        curl_easy_setopt(curl.get(), CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

        configure_common(curl.get(), options);

        CURLcode rc = curl_easy_perform(curl.get());

        if (ctx.cancelRequested) {
            spdlog::debug("stream: cancelled {}", urlStr);
            return Error{ErrorCode::Cancelled, "Download stopped by user"};
        }
        if (ctx.callbackError) {
            return *ctx.callbackError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "GET " + urlStr);
        }

        // Empty body: write_cb never ran
        if (!ctx.deliverHead()) {
            return *ctx.callbackError;
        }
        return Expected<void>{};
    }
};

} // namespace

/// Factory: libcurl-backed adapter used by DownloadManager when none is injected.
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace courier::transfer
