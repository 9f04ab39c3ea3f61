/*
 * http_transport_curl.cpp
 *
 * Notes
 * - Single GET per fetch() using the libcurl easy API; the caller runs it on its own thread.
 * - Honors request (connect + stall) and resource timeouts, TLS verify/CA, proxy, headers,
 *   redirects. Range is supplied by the caller through the header list.
 * - Always bypasses intermediary caches.
 * - Cooperative cancellation from both the write and the transfer-info callbacks, so an attempt
 *   stops promptly even while no bytes are flowing.
 * - Response metadata is parsed from the final header block (redirect blocks are discarded) and
 *   reported for every status, so the caller decides what an error status means before any body
 *   byte is delivered.
 *
 * Build
 * - Linked via CURL::libcurl; logs through spdlog.
 */

#include <streamcache/cache/cache.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace streamcache::cache {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

static std::optional<std::uint64_t> parse_u64(std::string_view sv) {
    std::uint64_t v{0};
    auto res = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (res.ec != std::errc() || res.ptr != sv.data() + sv.size())
        return std::nullopt;
    return v;
}

// Map CURLcode to Error. Connection-level failures are transient: the network went away or never
// came up, so the session waits for connectivity instead of failing.
static Error makeCurlError(CURLcode code, std::string_view where, long httpStatus) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_HTTP_RETURNED_ERROR:
            err.code = ErrorCode::ServerError;
            err.message = "HTTP error " + std::to_string(httpStatus);
            err.httpStatus = static_cast<int>(httpStatus);
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            err.code = ErrorCode::TransientConnectivityLoss;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Header parser context; reset on every status line so only the final response counts.
struct HeaderParseContext {
    bool acceptRangesBytes{false};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::uint64_t> totalLength{};
};

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    // Strip CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.size() >= 5 && line.substr(0, 5) == "HTTP/") {
        *ctx = HeaderParseContext{};
        return total;
    }

    // We expect "Key: Value"
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        if (to_lower(val) == "bytes") {
            ctx->acceptRangesBytes = true;
        }
    } else if (key == "content-length") {
        ctx->contentLength = parse_u64(val);
    } else if (key == "content-range") {
        // "bytes <first>-<last>/<total>" ; total may be "*"
        auto slash = val.rfind('/');
        if (slash != std::string::npos) {
            auto totalPart = std::string_view(val).substr(slash + 1);
            if (totalPart != "*") {
                ctx->totalLength = parse_u64(totalPart);
            }
            ctx->acceptRangesBytes = true;
        }
    }

    return total;
}

// Write sink context for fetch
struct WriteContext {
    CURL* curl{nullptr};
    const HeaderParseContext* headers{nullptr};
    const std::function<Expected<void>(const ResponseInfo&)>* onResponse{nullptr};
    const std::function<Expected<void>(ByteSpan)>* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    bool responseDelivered{false};
    bool cancelRequested{false};
    std::optional<Error> callbackError{};
};

static ResponseInfo collectResponse(CURL* curl, const HeaderParseContext& hctx) {
    ResponseInfo info;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &info.httpStatus);
    char* ct = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct != nullptr) {
        info.contentType = std::string(ct);
    }
    info.contentLength = hctx.contentLength;
    info.totalLength = hctx.totalLength;
    info.acceptRangesBytes = hctx.acceptRangesBytes;
    return info;
}

static bool deliverResponse(WriteContext& ctx) {
    if (ctx.responseDelivered)
        return true;
    ctx.responseDelivered = true;
    if (ctx.onResponse == nullptr || !*ctx.onResponse)
        return true;
    auto r = (*ctx.onResponse)(collectResponse(ctx.curl, *ctx.headers));
    if (!r.ok()) {
        ctx.callbackError = r.error();
        return false;
    }
    return true;
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    if (!deliverResponse(*ctx))
        return 0;

    ByteSpan bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (ctx->sink && *ctx->sink)
                 ? (*ctx->sink)(bytes)
                 : Expected<void>{Error{ErrorCode::FilesystemError, "No sink provided"}};
    if (!r.ok()) {
        ctx->callbackError = r.error();
        return 0;
    }
    return total;
}

// CURL transfer-info callback; non-zero aborts with CURLE_ABORTED_BY_CALLBACK
static int xferinfo_cb(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                       curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* ctx = static_cast<WriteContext*>(clientp);
    if (ctx && ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 1;
    }
    return 0;
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
    // Never serve from, or populate, intermediary caches
    list = curl_slist_append(list, "Cache-Control: no-cache");
    list = curl_slist_append(list, "Pragma: no-cache");
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, const FetchRequest& request) {
    // Timeouts: whole resource, connect, and stall (no byte for requestTimeout)
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.resourceTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.requestTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(
        curl, CURLOPT_LOW_SPEED_TIME,
        static_cast<long>(std::max<long long>(1, request.requestTimeout.count() / 1000)));

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

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

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FRESH_CONNECT, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

class CurlHttpTransport final : public IHttpTransport {
public:
    CurlHttpTransport() = default;
    ~CurlHttpTransport() override = default;

    Expected<void> fetch(const FetchRequest& request,
                         const std::function<Expected<void>(const ResponseInfo&)>& onResponse,
                         const std::function<Expected<void>(ByteSpan)>& sink,
                         const ShouldCancel& shouldCancel) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        curl_slist* list = build_header_list(request.headers);

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);

        HeaderParseContext hctx{};
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.curl = curl;
        wctx.headers = &hctx;
        wctx.onResponse = &onResponse;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &wctx);

        configure_common(curl, request);

        spdlog::debug("[CurlHttpTransport] GET {} (offset {})", request.url, request.offset);
        CURLcode rc = curl_easy_perform(curl);

        long http_status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

        // Empty body: the response was never reported through the write callback
        if (rc == CURLE_OK && !wctx.responseDelivered) {
            (void)deliverResponse(wctx);
        }

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (wctx.callbackError) {
            return *wctx.callbackError;
        }
        if (wctx.cancelRequested) {
            return Error{ErrorCode::Cancelled, "Transfer aborted by caller"};
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetch(GET)", http_status);
        }
        if (http_status < 200 || http_status >= 300) {
            return Error{ErrorCode::ServerError, "HTTP error " + std::to_string(http_status),
                         static_cast<int>(http_status)};
        }
        return Expected<void>{};
    }
};

std::shared_ptr<IHttpTransport> makeCurlHttpTransport() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("[CurlHttpTransport] curl_global_init failed");
        }
    });
    return std::make_shared<CurlHttpTransport>();
}

} // namespace streamcache::cache
