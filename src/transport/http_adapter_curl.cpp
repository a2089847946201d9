/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - One libcurl easy transfer per fetchRange() call; no retries here (TransportRetrier owns them).
 * - Honors timeout, TLS verify/CA, proxy, headers, redirects, and Range.
 * - Rejects a 200 reply to a ranged request so a chunk never receives the whole file.
 * - Cooperative cancellation from both the write and the transfer-info callbacks.
 * - Content-Length of a successful reply is announced before the first byte is written.
 */

#include <rangedb/transport/range_adapter.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <string>
#include <string_view>

namespace rangedb::transport {

namespace {

std::once_flag g_curlInitOnce;

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    std::string message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return Error{ErrorCode::Timeout, std::move(message)};
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            return Error{ErrorCode::PermissionDenied, std::move(message)};
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return Error{ErrorCode::NetworkError, std::move(message)};
        case CURLE_ABORTED_BY_CALLBACK:
            return Error{ErrorCode::OperationCancelled, std::move(message)};
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return Error{ErrorCode::InvalidArgument, std::move(message)};
        default:
            return Error{ErrorCode::Unknown, std::move(message)};
    }
}

Error makeHttpError(long status) {
    std::string message = "HTTP error " + std::to_string(status);
    if (status == 429 || status == 503) {
        return Error{ErrorCode::ResourceExhausted, std::move(message)};
    }
    if (status >= 500) {
        return Error{ErrorCode::NetworkError, std::move(message)};
    }
    if (status == 404 || status == 410) {
        return Error{ErrorCode::NotFound, std::move(message)};
    }
    if (status == 401 || status == 403) {
        return Error{ErrorCode::PermissionDenied, std::move(message)};
    }
    if (status == 416) {
        return Error{ErrorCode::InvalidArgument, std::move(message) + " (range not satisfiable)"};
    }
    return Error{ErrorCode::InvalidData, std::move(message)};
}

// Write sink context for fetchRange
struct WriteContext {
    CURL* curl{nullptr};
    const ByteSink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    const ContentLengthCallback* onContentLength{nullptr};
    bool ranged{false};
    bool statusChecked{false};
    bool cancelRequested{false};
    bool rangeIgnored{false};
    bool errorBody{false};
    std::optional<Error> sinkError;
    std::uint64_t received{0};
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx == nullptr || total == 0)
        return 0;

    if (*ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    if (!ctx->statusChecked) {
        ctx->statusChecked = true;
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        if (ctx->ranged && status == 200) {
            ctx->rangeIgnored = true;
            return 0;
        }
        ctx->errorBody = status >= 400;
        if (!ctx->errorBody && ctx->onContentLength && *ctx->onContentLength) {
            curl_off_t length = -1;
            if (curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) ==
                    CURLE_OK &&
                length > 0) {
                (*ctx->onContentLength)(static_cast<std::uint64_t>(length));
            }
        }
    }
    if (ctx->errorBody) {
        // Error bodies are not forwarded to the sink.
        return total;
    }

    auto r = (*ctx->sink)(ByteSpan{reinterpret_cast<const std::byte*>(ptr), total});
    if (!r) {
        ctx->sinkError = r.error();
        return 0;
    }
    ctx->received += total;
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 1;
    }
    return 0;
}

curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

void configure_common(CURL* curl, const FetchOptions& options) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(options.timeout.count(), 30000)));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    if (options.proxy && !options.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy->c_str());
    }

    // Compressed transfer encodings would break byte ranges.
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, nullptr);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

} // namespace

class CurlRangeAdapter final : public IRangeAdapter {
public:
    CurlRangeAdapter() {
        std::call_once(g_curlInitOnce, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }
    ~CurlRangeAdapter() override = default;

    Result<void> fetchRange(std::string_view url, std::uint64_t offset, std::uint64_t size,
                            const FetchOptions& options, const ByteSink& sink,
                            const ShouldCancel& shouldCancel) override {
        if (!sink) {
            return Error{ErrorCode::InvalidArgument, "fetchRange: no sink provided"};
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        const bool ranged = offset != 0 || size != 0;
        curl_slist* list = build_header_list(options.headers);
        if (ranged) {
            std::string rangeHeader = "Range: bytes=" + std::to_string(offset) + "-";
            if (size != 0) {
                rangeHeader += std::to_string(offset + size - 1);
            }
            list = curl_slist_append(list, rangeHeader.c_str());
        }

        const std::string urlCopy(url);
        curl_easy_setopt(curl, CURLOPT_URL, urlCopy.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);

        WriteContext wctx;
        wctx.curl = curl;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;
        wctx.onContentLength = &options.onContentLength;
        wctx.ranged = ranged;

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &wctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

        configure_common(curl, options);

        spdlog::debug("GET {} range=[{}, {}) timeout_ms={}", urlCopy, offset,
                      size == 0 ? std::string("eof") : std::to_string(offset + size),
                      options.timeout.count());

        CURLcode rc = curl_easy_perform(curl);

        long httpStatus = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpStatus);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (wctx.cancelRequested) {
            return Error{ErrorCode::OperationCancelled, "transfer abandoned"};
        }
        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (wctx.rangeIgnored) {
            return Error{ErrorCode::InvalidData,
                         "server ignored Range header (HTTP 200 to a ranged request)"};
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetchRange(GET)");
        }
        if (httpStatus >= 400) {
            return makeHttpError(httpStatus);
        }
        return {};
    }
};

std::unique_ptr<IRangeAdapter> makeCurlRangeAdapter() {
    return std::make_unique<CurlRangeAdapter>();
}

} // namespace rangedb::transport
