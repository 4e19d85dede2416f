/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - One streaming GET per call using the libcurl easy API; an easy handle per call keeps the
 *   adapter stateless so every engine thread can share it.
 * - Honors connect/low-speed timeouts, TLS verify/CA, proxy, headers, redirects, and Range.
 * - Response headers are delivered before the first body byte so the caller can decide how
 *   to treat the body (resume, restart, reject).
 * - Cooperative cancellation from both the write and the transfer-info callbacks.
 */

#include <dlcore/downloader/downloader.hpp>
#include <dlcore/downloader/http_headers.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <string_view>

namespace dlcore::downloader {

namespace {

void ensure_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlEasyDeleter {
    void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::DiskError;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::OperationCancelled;
            break;
        default:
            // DNS, connect, TLS, send/recv, partial file, too many redirects ...
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

// Per-transfer state shared with the curl callbacks
struct TransferContext {
    CURL* curl{nullptr};
    ResponseHeaderParser headers;
    const ResponseHandler* onResponse{nullptr};
    const BodySink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    bool responseDelivered{false};
    bool cancelled{false};
    std::optional<Error> abortError;

    bool cancelRequested() {
        if (!cancelled && shouldCancel && *shouldCancel && (*shouldCancel)()) {
            cancelled = true;
        }
        return cancelled;
    }

    Result<void> deliverResponse() {
        responseDelivered = true;
        auto& info = headers.info();
        long code = 0;
        if (curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code) == CURLE_OK && code > 0) {
            info.status = code;
        }
        spdlog::debug("HTTP {} content-length={} content-range={}{}", info.status,
                      info.contentLength ? std::to_string(*info.contentLength) : "-",
                      info.contentRange && info.contentRange->first
                          ? std::to_string(*info.contentRange->first)
                          : "-",
                      info.acceptRangesBytes ? " accept-ranges=bytes" : "");
        if (info.etag) {
            spdlog::debug("HTTP response ETag: {}", *info.etag);
        }
        if (onResponse && *onResponse) {
            return (*onResponse)(info);
        }
        return {};
    }
};

// CURL header callback
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<TransferContext*>(userdata);
    ctx->headers.feedLine(std::string_view(buffer, total));
    return total;
}

// CURL write callback
size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx->cancelRequested()) {
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    if (!ctx->responseDelivered) {
        if (auto r = ctx->deliverResponse(); !r) {
            ctx->abortError = r.error();
            return 0;
        }
    }
    if (total == 0)
        return 0;

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (ctx->sink && *ctx->sink) ? (*ctx->sink)(bytes)
                                       : Result<void>{Error{ErrorCode::InternalError,
                                                            "No sink provided"}};
    if (!r) {
        ctx->abortError = r.error();
        return 0;
    }
    return total;
}

// Polled by curl roughly once per second and on every socket event
int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return (ctx && ctx->cancelRequested()) ? 1 : 0;
}

// Helper to build curl_slist from headers
CurlSlistPtr build_header_list(const HttpRequest& request) {
    curl_slist* list = nullptr;
    auto append = [&list](const std::string& line) -> bool {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next)
            return false;
        list = next;
        return true;
    };
    for (const auto& h : request.headers) {
        if (!append(h.name + ": " + h.value))
            break;
    }
    if (request.offset > 0) {
        // Open-ended range from offset
        append("Range: bytes=" + std::to_string(request.offset) + "-");
    }
    return CurlSlistPtr{list};
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, const HttpRequest& request) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.connectTimeout.count()));
    if (request.lowSpeedTimeout.count() > 0) {
        const long seconds = std::max<long>(
            1, static_cast<long>(
                   std::chrono::duration_cast<std::chrono::seconds>(request.lowSpeedTimeout)
                       .count()));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, seconds);
    }

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.tls.insecure ? 0L : 2L);
    if (!request.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, request.tls.caPath.c_str());
    }

    // Proxy
    if (request.proxy && !request.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, request.proxy->c_str());
    }

    if (!request.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, request.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE,
                     static_cast<long>(std::clamp(request.bufferSize, MIN_CHUNK_SIZE,
                                                  MAX_CHUNK_SIZE)));
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensure_global_init(); }
    ~CurlHttpAdapter() override = default;

    Result<HttpResponseInfo> get(const HttpRequest& request, const ResponseHandler& onResponse,
                                 const BodySink& sink, const ShouldCancel& shouldCancel) override {
        CurlEasyPtr curl{curl_easy_init()};
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        TransferContext ctx;
        ctx.curl = curl.get();
        ctx.onResponse = &onResponse;
        ctx.sink = &sink;
        ctx.shouldCancel = &shouldCancel;

        if (ctx.cancelRequested()) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled before connect"};
        }

        auto list = build_header_list(request);

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());

        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

        configure_common(curl.get(), request);

        spdlog::debug("HTTP GET {} (offset {})", request.url, request.offset);
        CURLcode rc = curl_easy_perform(curl.get());

        if (ctx.cancelled) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
        }
        if (ctx.abortError) {
            return *ctx.abortError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "GET " + request.url);
        }
        if (!ctx.responseDelivered) {
            // Empty body (e.g. 416, 204, zero-length file)
            if (auto r = ctx.deliverResponse(); !r) {
                return r.error();
            }
        }
        return ctx.headers.info();
    }
};

} // namespace

/// Factory: the adapter is stateless and may be shared by every transfer.
std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_shared<CurlHttpAdapter>();
}

} // namespace dlcore::downloader
