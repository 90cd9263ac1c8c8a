/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - The adapter is the shared network client: it owns curl global state and a CURLSH
 *   share handle (connections, DNS, TLS sessions) reused by every attempt.
 * - Each attempt builds its own easy handle and header list; nothing set for one
 *   identity candidate can leak into the next.
 * - fetchHead(): GET that aborts at the first body byte (some servers reject HEAD).
 * - openStream(): pull-style body reader over a curl multi handle with a bounded
 *   buffer; the transfer is paused while the reader is behind.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <webget/downloader/downloader.hpp>
#include <webget/downloader/http_headers.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

namespace webget::downloader {

namespace {

// Upper bound on body bytes held in memory before the transfer is paused.
constexpr std::size_t kMaxBufferedBytes = 256 * 1024;

struct EasyDeleter {
    void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};
struct MultiDeleter {
    void operator()(CURLM* h) const noexcept { curl_multi_cleanup(h); }
};
struct ShareDeleter {
    void operator()(CURLSH* h) const noexcept { curl_share_cleanup(h); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using MultiHandle = std::unique_ptr<CURLM, MultiDeleter>;
using ShareHandle = std::unique_ptr<CURLSH, ShareDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_TOO_MANY_REDIRECTS:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

Error makeStatusError(int status, std::string reason) {
    Error err;
    err.code = ErrorCode::HttpStatus;
    err.httpStatus = status;
    err.reason = std::move(reason);
    err.message = "HTTP " + std::to_string(status);
    if (!err.reason.empty()) {
        err.message += " " + err.reason;
    }
    return err;
}

// CURL header callback; one call per raw header line
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    static_cast<ResponseHeadCollector*>(userdata)->addLine(std::string_view(buffer, total));
    return total;
}

// Headers-only fetch: abort at the first body byte
struct HeadOnlyContext {
    bool bodyReached{false};
};

size_t head_write_cb(char*, size_t, size_t, void* userdata) {
    if (userdata != nullptr) {
        static_cast<HeadOnlyContext*>(userdata)->bodyReached = true;
    }
    return 0; // signal error to curl => CURLE_WRITE_ERROR
}

// Helper to build curl_slist from an attempt (extra headers + identity)
HeaderList build_header_list(const HttpAttempt& attempt) {
    curl_slist* list = nullptr;
    for (const auto& line : requestHeaderLines(attempt)) {
        list = curl_slist_append(list, line.c_str());
    }
    return HeaderList{list};
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, const ClientOptions& options, CURLSH* share) {
    // Timeouts (no overall deadline)
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options.connectTimeout.count()));
    if (options.lowSpeedTimeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                         static_cast<long>(options.lowSpeedTimeout.count()));
    }
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options.maxRedirects);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    // Proxy
    if (options.proxy && !options.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy->c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

    if (share != nullptr) {
        curl_easy_setopt(curl, CURLOPT_SHARE, share);
    }
}

std::string effective_url(CURL* curl, std::string_view fallback) {
    char* eff = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &eff) == CURLE_OK && eff != nullptr) {
        return std::string(eff);
    }
    return std::string(fallback);
}

HttpResponseHead make_head(CURL* curl, const HttpAttempt& attempt,
                           const ResponseHeadCollector& hctx) {
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    return hctx.head(static_cast<int>(http_status), effective_url(curl, attempt.url));
}

// ---------- Body stream ----------

class CurlByteStream final : public IByteStream {
public:
    CurlByteStream() = default;
    ~CurlByteStream() override {
        if (multi_ && easy_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
        }
    }

    CurlByteStream(const CurlByteStream&) = delete;
    CurlByteStream& operator=(const CurlByteStream&) = delete;

    Expected<void> start(const HttpAttempt& attempt, const ClientOptions& options,
                         CURLSH* share) {
        easy_.reset(curl_easy_init());
        multi_.reset(curl_multi_init());
        if (!easy_ || !multi_) {
            return Error{ErrorCode::Unknown, "curl handle init failed"};
        }
        headers_ = build_header_list(attempt);

        CURL* curl = easy_.get();
        curl_easy_setopt(curl, CURLOPT_URL, attempt.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_.get());
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx_);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlByteStream::write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
        configure_common(curl, options, share);

        if (auto mc = curl_multi_add_handle(multi_.get(), curl); mc != CURLM_OK) {
            return Error{ErrorCode::Unknown,
                         std::string("curl_multi_add_handle: ") + curl_multi_strerror(mc)};
        }

        // Drive until the final response is known: first body byte or completion
        while (!done_ && buffered() == 0 && !paused_) {
            auto r = pump();
            if (!r.ok())
                return r;
        }
        if (done_ && result_ != CURLE_OK) {
            return makeCurlError(result_, "openStream(GET)");
        }

        head_ = make_head(curl, attempt, hctx_);
        if (!isSuccessStatus(head_.status)) {
            return makeStatusError(head_.status, head_.reason);
        }
        return Expected<void>{};
    }

    Expected<std::size_t> read(std::span<std::byte> buffer) override {
        if (buffer.empty())
            return std::size_t{0};

        while (buffered() == 0) {
            if (done_) {
                if (result_ != CURLE_OK) {
                    return makeCurlError(result_, "read");
                }
                return std::size_t{0};
            }
            if (paused_) {
                paused_ = false;
                if (auto rc = curl_easy_pause(easy_.get(), CURLPAUSE_CONT); rc != CURLE_OK) {
                    return makeCurlError(rc, "curl_easy_pause");
                }
                continue;
            }
            auto r = pump();
            if (!r.ok())
                return r.error();
        }

        const std::size_t n = std::min(buffer.size(), buffered());
        std::memcpy(buffer.data(), buffer_.data() + offset_, n);
        offset_ += n;
        if (offset_ == buffer_.size()) {
            buffer_.clear();
            offset_ = 0;
        }
        return n;
    }

    [[nodiscard]] const HttpResponseHead& head() const override { return head_; }

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
        const size_t total = size * nmemb;
        if (userdata == nullptr)
            return 0;
        auto* self = static_cast<CurlByteStream*>(userdata);
        if (self->buffered() >= kMaxBufferedBytes) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        self->buffer_.append(ptr, total);
        return total;
    }

    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size() - offset_; }

    Expected<void> pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_.get(), &running);
        if (mc != CURLM_OK) {
            return Error{ErrorCode::NetworkError,
                         std::string("curl_multi_perform: ") + curl_multi_strerror(mc)};
        }

        int left = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &left)) {
            if (msg->msg == CURLMSG_DONE) {
                done_ = true;
                result_ = msg->data.result;
            }
        }

        if (!done_ && running > 0 && buffered() == 0 && !paused_) {
            mc = curl_multi_poll(multi_.get(), nullptr, 0, 1000, nullptr);
            if (mc != CURLM_OK) {
                return Error{ErrorCode::NetworkError,
                             std::string("curl_multi_poll: ") + curl_multi_strerror(mc)};
            }
        }
        return Expected<void>{};
    }

    EasyHandle easy_;
    MultiHandle multi_;
    HeaderList headers_;
    ResponseHeadCollector hctx_{};
    HttpResponseHead head_{};

    std::string buffer_;
    std::size_t offset_{0};
    bool paused_{false};
    bool done_{false};
    CURLcode result_{CURLE_OK};
};

} // namespace

class CurlHttpAdapter final : public IHttpAdapter {
public:
    explicit CurlHttpAdapter(ClientOptions options) : options_(std::move(options)) {
        globalOk_ = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
        if (!globalOk_) {
            spdlog::error("curl_global_init failed");
            return;
        }
        share_.reset(curl_share_init());
        if (share_) {
            curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
            curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
            curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        } else {
            spdlog::warn("curl_share_init failed; connections will not be reused");
        }
    }

    ~CurlHttpAdapter() override {
        share_.reset();
        if (globalOk_) {
            curl_global_cleanup();
        }
    }

    CurlHttpAdapter(const CurlHttpAdapter&) = delete;
    CurlHttpAdapter& operator=(const CurlHttpAdapter&) = delete;

    Expected<HttpResponseHead> fetchHead(const HttpAttempt& attempt) override {
        if (!globalOk_) {
            return Error{ErrorCode::Unknown, "curl is not initialized"};
        }
        EasyHandle curl{curl_easy_init()};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        auto list = build_header_list(attempt);
        ResponseHeadCollector hctx{};
        HeadOnlyContext wctx{};

        curl_easy_setopt(curl.get(), CURLOPT_URL, attempt.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, head_write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &wctx);
        configure_common(curl.get(), options_, share_.get());

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK && !(rc == CURLE_WRITE_ERROR && wctx.bodyReached)) {
            return makeCurlError(rc, "fetchHead(GET)");
        }

        auto head = make_head(curl.get(), attempt, hctx);
        spdlog::debug("fetchHead {} -> {} {} ({})", attempt.url, head.status, head.reason,
                      head.effectiveUrl);
        if (!isSuccessStatus(head.status)) {
            return makeStatusError(head.status, head.reason);
        }
        return head;
    }

    Expected<std::unique_ptr<IByteStream>> openStream(const HttpAttempt& attempt) override {
        if (!globalOk_) {
            return Error{ErrorCode::Unknown, "curl is not initialized"};
        }
        auto stream = std::make_unique<CurlByteStream>();
        auto r = stream->start(attempt, options_, share_.get());
        if (!r.ok()) {
            return r.error();
        }
        spdlog::debug("openStream {} -> {} ({})", attempt.url, stream->head().status,
                      stream->head().effectiveUrl);
        return std::unique_ptr<IByteStream>(std::move(stream));
    }

private:
    ClientOptions options_;
    ShareHandle share_;
    bool globalOk_{false};
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter(const ClientOptions& options) {
    return std::make_unique<CurlHttpAdapter>(options);
}

} // namespace webget::downloader
