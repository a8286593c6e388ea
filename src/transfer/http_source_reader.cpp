/*
 * http_source_reader.cpp
 *
 * Notes
 * - Pull-model source over the libcurl multi interface: the write callback buffers up to a
 *   high-water mark and pauses the transfer; read() drains the buffer and unpauses.
 * - Honors timeouts, stall detection, TLS verify/CA, headers, redirects and Range.
 * - Maps HTTP status and CURLcode into the source error taxonomy.
 */

#include <sluice/transfer/transfer.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <mutex>

namespace sluice::transfer {

namespace {

constexpr std::size_t kHighWaterBytes = 1ull * 1024ull * 1024ull;
constexpr int kPollTimeoutMs = 100;

constexpr long HTTP_OK = 200;
constexpr long HTTP_PARTIAL_CONTENT = 206;
constexpr long HTTP_NOT_FOUND = 404;
constexpr long HTTP_REQUEST_TIMEOUT = 408;
constexpr long HTTP_GONE = 410;
constexpr long HTTP_RANGE_NOT_SATISFIABLE = 416;
constexpr long HTTP_TOO_MANY_REQUESTS = 429;

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

std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::uint64_t v{0};
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view url) {
    std::string msg = std::string(url) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            return Error{ErrorCode::InvalidRequest, std::move(msg)};
        case CURLE_TOO_MANY_REDIRECTS:
            return Error{ErrorCode::SourceNotFound, std::move(msg)};
        default:
            // Timeouts, resolver/connect failures, resets, partial bodies, TLS handshakes
            return Error{ErrorCode::SourceUnreachable, std::move(msg)};
    }
}

Error makeStatusError(long status, std::string_view url) {
    std::string msg = "HTTP " + std::to_string(status) + " from " + std::string(url);
    if (status == HTTP_REQUEST_TIMEOUT || status == HTTP_TOO_MANY_REQUESTS || status >= 500) {
        return Error{ErrorCode::SourceUnreachable, std::move(msg)};
    }
    if (status == HTTP_NOT_FOUND || status == HTTP_GONE) {
        return Error{ErrorCode::SourceNotFound, std::move(msg)};
    }
    // Remaining 4xx (auth, forbidden, bad request) will not change on retry
    return Error{ErrorCode::SourceNotFound, std::move(msg)};
}

// Parsed "Content-Range: bytes first-last/total" or "bytes */total"
struct ContentRange {
    std::optional<std::uint64_t> first;
    std::optional<std::uint64_t> total;
};

std::optional<ContentRange> parseContentRange(std::string_view value) {
    auto v = trim(value);
    std::string_view sv(v);
    if (sv.size() < 6 || to_lower(sv.substr(0, 6)) != "bytes ") {
        return std::nullopt;
    }
    sv.remove_prefix(6);
    auto slash = sv.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }
    ContentRange cr;
    auto range = sv.substr(0, slash);
    auto total = sv.substr(slash + 1);
    if (total != "*") {
        cr.total = parse_u64(total);
    }
    if (range != "*") {
        auto dash = range.find('-');
        if (dash == std::string_view::npos) {
            return std::nullopt;
        }
        cr.first = parse_u64(range.substr(0, dash));
    }
    return cr;
}

// Header parser context (reset on every status line so redirects don't leak headers)
struct HeaderParseContext {
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::string> contentRange;
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    std::optional<std::string> contentType;
    std::optional<std::string> contentDisposition;
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.size() >= 5 && line.substr(0, 5) == "HTTP/") {
        *ctx = HeaderParseContext{};
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "content-length") {
        ctx->contentLength = parse_u64(val);
    } else if (key == "content-range") {
        ctx->contentRange = val;
    } else if (key == "etag") {
        // Weak validators (W/"...") do not prove byte identity
        if (val.rfind("W/", 0) != 0) {
            ctx->etag = std::move(val);
        }
    } else if (key == "last-modified") {
        ctx->lastModified = std::move(val);
    } else if (key == "content-type") {
        ctx->contentType = std::move(val);
    } else if (key == "content-disposition") {
        ctx->contentDisposition = std::move(val);
    }

    return total;
}

// Helper to build curl_slist from headers
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

// Common CURL easy handle configuration
void configure_common(CURL* curl, const SourceOptions& options) {
    // Timeouts and stall detection
    if (options.timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
    }
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options.connectTimeout.count()));
    if (options.lowSpeedLimitBps > 0 && options.lowSpeedTime.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, options.lowSpeedLimitBps);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                         static_cast<long>(options.lowSpeedTime.count()));
    }

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options.maxRedirects);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    if (!options.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

} // namespace

class CurlSourceStream final : public ISourceStream {
public:
    CurlSourceStream(std::string url, std::uint64_t offset) : url_(std::move(url)) {
        info_.offset = offset;
        info_.effectiveUrl = url_;
    }

    ~CurlSourceStream() override {
        if (multi_ && easy_) {
            curl_multi_remove_handle(multi_, easy_);
        }
        if (easy_) {
            curl_easy_cleanup(easy_);
        }
        if (multi_) {
            curl_multi_cleanup(multi_);
        }
        if (headers_) {
            curl_slist_free_all(headers_);
        }
    }

    CurlSourceStream(const CurlSourceStream&) = delete;
    CurlSourceStream& operator=(const CurlSourceStream&) = delete;

    Result<void> start(const SourceOptions& options) {
        easy_ = curl_easy_init();
        multi_ = curl_multi_init();
        if (!easy_ || !multi_) {
            return Error{ErrorCode::InternalError, "curl handle initialization failed"};
        }

        headers_ = build_header_list(options.headers);
        if (info_.offset > 0) {
            std::string range = "Range: bytes=" + std::to_string(info_.offset) + "-";
            headers_ = curl_slist_append(headers_, range.c_str());
        }

        curl_easy_setopt(easy_, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(easy_, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlSourceStream::write_cb);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(easy_, CURLOPT_HEADERDATA, &hctx_);
        configure_common(easy_, options);

        if (auto mc = curl_multi_add_handle(multi_, easy_); mc != CURLM_OK) {
            return Error{ErrorCode::InternalError,
                         std::string("curl_multi_add_handle: ") + curl_multi_strerror(mc)};
        }

        // Pump until the response body starts or the transfer ends
        while (!bodyStarted_ && !done_) {
            if (auto r = pump({}); !r) {
                return r.error();
            }
        }

        if (done_ && doneCode_ != CURLE_OK && !bodyStarted_) {
            return makeCurlError(doneCode_, url_);
        }
        return inspectResponse();
    }

    const SourceInfo& info() const override { return info_; }

    Result<std::size_t> read(std::span<std::byte> buffer,
                             const ShouldCancel& shouldCancel) override {
        if (buffer.empty()) {
            return std::size_t{0};
        }
        while (available() == 0 && !done_ && !emptyBody_) {
            if (auto r = pump(shouldCancel); !r) {
                return r.error();
            }
        }

        if (available() == 0) {
            if (emptyBody_) {
                return std::size_t{0};
            }
            if (doneCode_ != CURLE_OK) {
                return makeCurlError(doneCode_, url_);
            }
            return std::size_t{0};
        }

        auto n = std::min(buffer.size(), available());
        std::memcpy(buffer.data(), pending_.data() + readPos_, n);
        readPos_ += n;
        if (readPos_ == pending_.size()) {
            pending_.clear();
            readPos_ = 0;
        }
        return n;
    }

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlSourceStream*>(userdata);
        const size_t total = size * nmemb;
        self->bodyStarted_ = true;
        if (self->discardBody_) {
            return total;
        }
        if (self->available() >= kHighWaterBytes) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        if (self->readPos_ > 0) {
            self->pending_.erase(self->pending_.begin(),
                                 self->pending_.begin() + static_cast<std::ptrdiff_t>(self->readPos_));
            self->readPos_ = 0;
        }
        auto* bytes = reinterpret_cast<const std::byte*>(ptr);
        self->pending_.insert(self->pending_.end(), bytes, bytes + total);
        return total;
    }

    std::size_t available() const { return pending_.size() - readPos_; }

    // One step of the multi loop: unpause if drained, perform, wait for activity
    Result<void> pump(const ShouldCancel& shouldCancel) {
        if (shouldCancel && shouldCancel()) {
            return Error{ErrorCode::OperationCancelled, "Source read cancelled"};
        }
        if (paused_ && available() < kHighWaterBytes) {
            paused_ = false;
            curl_easy_pause(easy_, CURLPAUSE_CONT);
        }

        int running = 0;
        if (auto mc = curl_multi_perform(multi_, &running); mc != CURLM_OK) {
            return Error{ErrorCode::SourceUnreachable,
                         std::string("curl_multi_perform: ") + curl_multi_strerror(mc)};
        }

        int msgs = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &msgs)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                done_ = true;
                doneCode_ = msg->data.result;
            }
        }

        // While paused the caller must drain before curl can make progress
        if (!done_ && running > 0 && !paused_) {
            if (auto mc = curl_multi_poll(multi_, nullptr, 0, kPollTimeoutMs, nullptr);
                mc != CURLM_OK) {
                return Error{ErrorCode::SourceUnreachable,
                             std::string("curl_multi_poll: ") + curl_multi_strerror(mc)};
            }
        }
        return {};
    }

    Result<void> inspectResponse() {
        long status = 0;
        curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status);
        char* effective = nullptr;
        if (curl_easy_getinfo(easy_, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK &&
            effective) {
            info_.effectiveUrl = effective;
        }

        info_.validator.etag = hctx_.etag;
        info_.validator.lastModified = hctx_.lastModified;
        info_.contentType = hctx_.contentType;
        info_.contentDisposition = hctx_.contentDisposition;

        const std::uint64_t offset = info_.offset;
        std::optional<ContentRange> cr;
        if (hctx_.contentRange) {
            cr = parseContentRange(*hctx_.contentRange);
        }

        if (status == HTTP_PARTIAL_CONTENT) {
            if (!cr || cr->first.value_or(offset) != offset) {
                discardBody_ = true;
                return Error{ErrorCode::SourceRangeUnsupported,
                             "Source answered range from " + std::to_string(offset) +
                                 " with Content-Range '" + hctx_.contentRange.value_or("") + "'"};
            }
            info_.totalBytes = cr->total;
            if (!info_.totalBytes && hctx_.contentLength) {
                info_.totalBytes = offset + *hctx_.contentLength;
            }
        } else if (status == HTTP_OK) {
            if (offset > 0) {
                discardBody_ = true;
                return Error{ErrorCode::SourceRangeUnsupported,
                             "Source ignored Range request for " + url_};
            }
            info_.totalBytes = hctx_.contentLength;
        } else if (status == HTTP_RANGE_NOT_SATISFIABLE) {
            discardBody_ = true;
            auto total = cr ? cr->total : std::nullopt;
            if (total && *total == offset) {
                // Everything already transferred
                info_.totalBytes = total;
                emptyBody_ = true;
                return {};
            }
            if (total && offset > *total) {
                return Error{ErrorCode::StateCorruption,
                             "Recorded offset " + std::to_string(offset) +
                                 " exceeds source length " + std::to_string(*total)};
            }
            return Error{ErrorCode::SourceRangeUnsupported,
                         "Source rejected range from " + std::to_string(offset)};
        } else {
            discardBody_ = true;
            return makeStatusError(status, url_);
        }

        spdlog::debug("Source {} opened at {} (status {}, total {}, etag {})", url_, offset,
                      status, info_.totalBytes ? std::to_string(*info_.totalBytes) : "unknown",
                      info_.validator.etag.value_or("-"));
        return {};
    }

    std::string url_;
    SourceInfo info_;
    CURL* easy_{nullptr};
    CURLM* multi_{nullptr};
    curl_slist* headers_{nullptr};
    HeaderParseContext hctx_{};

    std::vector<std::byte> pending_;
    std::size_t readPos_{0};
    bool paused_{false};
    bool bodyStarted_{false};
    bool discardBody_{false};
    bool emptyBody_{false};
    bool done_{false};
    CURLcode doneCode_{CURLE_OK};
};

class HttpSourceReader final : public ISourceReader {
public:
    HttpSourceReader() {
        static std::once_flag curlInitFlag;
        std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
    }

    Result<std::unique_ptr<ISourceStream>> open(std::string_view url, std::uint64_t offset,
                                                const SourceOptions& options) override {
        auto stream = std::make_unique<CurlSourceStream>(std::string(url), offset);
        if (auto r = stream->start(options); !r) {
            spdlog::debug("Source open failed for {} at {}: {}", url, offset, r.error().message);
            return r.error();
        }
        return std::unique_ptr<ISourceStream>(std::move(stream));
    }
};

std::unique_ptr<ISourceReader> makeHttpSourceReader() {
    return std::make_unique<HttpSourceReader>();
}

} // namespace sluice::transfer
