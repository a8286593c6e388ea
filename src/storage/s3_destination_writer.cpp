#include <sluice/crypto/hasher.h>
#include <sluice/storage/destination_writer.h>
#include <sluice/storage/s3_signer.h>
#include <sluice/storage/s3_xml.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>
#include <sstream>

namespace sluice::storage {

namespace {
constexpr long HTTP_UNAUTHORIZED = 401;
constexpr long HTTP_FORBIDDEN = 403;
constexpr long HTTP_NOT_FOUND = 404;
constexpr long HTTP_REQUEST_TIMEOUT = 408;
constexpr long HTTP_TOO_MANY_REQUESTS = 429;
constexpr long HTTP_CLIENT_ERROR_LO = 400;
constexpr long HTTP_SERVER_ERROR_LO = 500;
constexpr long HTTP_SUCCESS_LO = 200;
constexpr long HTTP_SUCCESS_HI = 299; // inclusive upper bound
constexpr int kListPartsPageSize = 1000;
} // namespace

// Write callback for libcurl
static auto writeCallback(void* contents, size_t size, size_t nmemb, void* userp) -> size_t {
    auto* out = static_cast<std::string*>(userp);
    size_t totalSize = size * nmemb;
    out->append(static_cast<const char*>(contents), totalSize);
    return totalSize;
}

// Read callback for libcurl uploads
struct ReadData {
    const std::byte* data;
    size_t size;
    size_t offset;
};

static auto readCallback(void* buffer, size_t size, size_t nmemb, void* userp) -> size_t {
    auto* readData = static_cast<ReadData*>(userp);
    size_t bufferSize = size * nmemb;
    size_t remaining = readData->size - readData->offset;
    size_t toRead = std::min(bufferSize, remaining);

    if (toRead > 0) {
        std::memcpy(buffer, readData->data + readData->offset, toRead);
        readData->offset += toRead;
    }

    return toRead;
}

class S3DestinationWriter::Impl {
public:
    Impl(S3Config cfg, std::string bucketName) : config(std::move(cfg)), bucket(std::move(bucketName)) {
        static std::once_flag curlInitFlag;
        std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });

        std::string endpoint = config.endpoint;
        if (endpoint.empty()) {
            endpoint = "https://s3." + (config.region.empty() ? std::string("us-east-1")
                                                              : config.region) +
                       ".amazonaws.com";
        }
        while (!endpoint.empty() && endpoint.back() == '/') {
            endpoint.pop_back();
        }
        auto pos = endpoint.find("://");
        if (pos == std::string::npos) {
            scheme = "https";
            host = endpoint;
        } else {
            scheme = endpoint.substr(0, pos);
            host = endpoint.substr(pos + 3);
        }
    }

    struct Response {
        long statusCode{0};
        std::unordered_map<std::string, std::string> headers; // lower-case names
        std::string body;
    };

    S3Config config;
    std::string bucket;
    std::string scheme;
    std::string host;

    auto objectUrl(std::string_view key, std::string_view query) const -> std::string {
        std::string url;
        const auto encodedKey = S3Signer::uriEncode(key, /*encodeSlash=*/false);
        if (config.usePathStyle) {
            url = scheme + "://" + host + "/" + bucket + "/" + encodedKey;
        } else {
            url = scheme + "://" + bucket + "." + host + "/" + encodedKey;
        }
        if (!query.empty()) {
            url.push_back('?');
            url.append(query);
        }
        return url;
    }

    static auto headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
        auto line = std::string(buffer, size * nitems);
        auto* resp = static_cast<Response*>(userdata);
        if (line.rfind("HTTP/", 0) == 0) {
            // New status line (redirect or 100-continue): drop earlier headers
            resp->headers.clear();
            return size * nitems;
        }
        auto pos = line.find(':');
        if (pos != std::string::npos) {
            auto name = line.substr(0, pos);
            auto value = line.substr(pos + 1);
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
                value.erase(0, 1);
            }
            while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
                value.pop_back();
            }
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            resp->headers[name] = value;
        }
        return size * nitems;
    }

    auto perform(const std::string& method, const std::string& url,
                 std::span<const std::byte> body,
                 const std::vector<std::pair<std::string, std::string>>& extraHeaders = {})
        -> Result<Response> {
        const std::string payloadHash =
            body.empty() ? std::string(S3Signer::kEmptyPayloadSha256)
                         : crypto::SHA256Hasher::hash(body);
        auto signedHeaders = S3Signer::signRequest(config, method, url, payloadHash, extraHeaders);
        if (!signedHeaders) {
            return signedHeaders.error();
        }

        CURL* curl = curl_easy_init();
        if (curl == nullptr) {
            return Error{ErrorCode::InternalError, "Failed to initialize CURL"};
        }

        curl_slist* headerList = nullptr;
        for (const auto& line : signedHeaders.value()) {
            headerList = curl_slist_append(headerList, line.c_str());
        }
        // Suppress 100-continue round trips on part uploads
        headerList = curl_slist_append(headerList, "Expect:");

        Response response;
        ReadData readData{.data = body.data(), .size = body.size(), .offset = 0};

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, config.requestTimeoutMs);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, config.connectTimeoutMs);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (method == "PUT") {
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &readData);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(body.size()));
        } else if (method == "POST") {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, reinterpret_cast<const char*>(body.data()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(body.size()));
        } else if (method == "HEAD") {
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        } else if (method != "GET") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
        }

        CURLcode res = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.statusCode);
        curl_slist_free_all(headerList);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            return Error{ErrorCode::DestinationUnreachable,
                         method + " " + url + ": " + curl_easy_strerror(res)};
        }

        spdlog::debug("S3 {} {} -> {}", method, url, response.statusCode);
        return response;
    }

    // Map a non-2xx S3 response to the destination error taxonomy
    static auto classify(const Response& resp, std::string_view what) -> Error {
        const auto code = extractXmlTag(resp.body, "Code").value_or("");
        const auto message = extractXmlTag(resp.body, "Message").value_or("");
        std::string detail = std::string(what) + ": HTTP " + std::to_string(resp.statusCode);
        if (!code.empty()) {
            detail += " " + code;
        }
        if (!message.empty()) {
            detail += " (" + message + ")";
        }

        const long status = resp.statusCode;
        if (code == "NoSuchUpload") {
            return Error{ErrorCode::DestinationUploadExpired, detail};
        }
        if (status == HTTP_UNAUTHORIZED || status == HTTP_FORBIDDEN) {
            return Error{ErrorCode::DestinationDenied, detail};
        }
        if (status == HTTP_REQUEST_TIMEOUT || status == HTTP_TOO_MANY_REQUESTS ||
            status >= HTTP_SERVER_ERROR_LO || code == "SlowDown" || code == "RequestTimeout" ||
            code == "InternalError") {
            return Error{ErrorCode::DestinationUnreachable, detail};
        }
        if (status >= HTTP_CLIENT_ERROR_LO) {
            return Error{ErrorCode::DestinationDenied, detail};
        }
        return Error{ErrorCode::DestinationUnreachable, detail};
    }

    static auto isSuccess(long status) -> bool {
        return status >= HTTP_SUCCESS_LO && status <= HTTP_SUCCESS_HI;
    }
};

S3DestinationWriter::S3DestinationWriter(S3Config config, std::string bucket)
    : pImpl(std::make_unique<Impl>(std::move(config), std::move(bucket))) {
    spdlog::debug("Initialized S3 destination: bucket={}, endpoint={}://{}, pathStyle={}",
                  pImpl->bucket, pImpl->scheme, pImpl->host, pImpl->config.usePathStyle);
}

S3DestinationWriter::~S3DestinationWriter() = default;

std::string S3DestinationWriter::objectUrl(std::string_view key, std::string_view query) const {
    return pImpl->objectUrl(key, query);
}

Result<std::string> S3DestinationWriter::initiate(std::string_view key,
                                                  const UploadOptions& options) {
    std::vector<std::pair<std::string, std::string>> extra;
    if (options.contentType && !options.contentType->empty()) {
        extra.emplace_back("content-type", *options.contentType);
    }

    auto resp = pImpl->perform("POST", objectUrl(key, "uploads"), {}, extra);
    if (!resp) {
        return resp.error();
    }
    const auto& r = resp.value();
    if (!Impl::isSuccess(r.statusCode)) {
        return Impl::classify(r, "CreateMultipartUpload");
    }

    auto uploadId = extractXmlTag(r.body, "UploadId");
    if (!uploadId || uploadId->empty()) {
        return Error{ErrorCode::DestinationUnreachable,
                     "CreateMultipartUpload: response carries no UploadId"};
    }
    spdlog::debug("S3 multipart upload started for s3://{}/{} (uploadId={})", pImpl->bucket, key,
                  *uploadId);
    return *uploadId;
}

Result<PartInfo> S3DestinationWriter::writePart(std::string_view key, std::string_view uploadId,
                                                std::uint32_t index,
                                                std::span<const std::byte> data) {
    const std::string query = "partNumber=" + std::to_string(index) +
                              "&uploadId=" + S3Signer::uriEncode(uploadId, true);
    auto resp = pImpl->perform("PUT", objectUrl(key, query), data);
    if (!resp) {
        return resp.error();
    }
    const auto& r = resp.value();
    if (!Impl::isSuccess(r.statusCode)) {
        return Impl::classify(r, "UploadPart");
    }

    auto it = r.headers.find("etag");
    if (it == r.headers.end() || it->second.empty()) {
        return Error{ErrorCode::DestinationUnreachable, "UploadPart: response carries no ETag"};
    }

    PartInfo part;
    part.index = index;
    part.size = data.size();
    part.etag = it->second;
    return part;
}

Result<std::string> S3DestinationWriter::complete(std::string_view key, std::string_view uploadId,
                                                  const std::vector<PartInfo>& parts) {
    const std::string body = buildCompleteMultipartBody(parts);
    const std::string query = "uploadId=" + S3Signer::uriEncode(uploadId, true);
    auto resp = pImpl->perform(
        "POST", objectUrl(key, query),
        std::as_bytes(std::span<const char>(body.data(), body.size())),
        {{"content-type", "application/xml"}});
    if (!resp) {
        return resp.error();
    }
    const auto& r = resp.value();
    // CompleteMultipartUpload may report failure inside a 200 response
    if (!Impl::isSuccess(r.statusCode) || r.body.find("<Error>") != std::string::npos) {
        auto err = Impl::classify(r, "CompleteMultipartUpload");
        if (Impl::isSuccess(r.statusCode) && err.code == ErrorCode::DestinationDenied) {
            // Errors embedded in a 200 are server-side (e.g. InternalError); retry later
            err.code = ErrorCode::DestinationUnreachable;
        }
        return err;
    }
    return "s3://" + pImpl->bucket + "/" + std::string(key);
}

Result<void> S3DestinationWriter::abort(std::string_view key, std::string_view uploadId) {
    const std::string query = "uploadId=" + S3Signer::uriEncode(uploadId, true);
    auto resp = pImpl->perform("DELETE", objectUrl(key, query), {});
    if (!resp) {
        return resp.error();
    }
    const auto& r = resp.value();
    if (Impl::isSuccess(r.statusCode) || r.statusCode == HTTP_NOT_FOUND) {
        return {};
    }
    return Impl::classify(r, "AbortMultipartUpload");
}

Result<std::vector<PartInfo>> S3DestinationWriter::reopen(std::string_view key,
                                                          std::string_view uploadId) {
    std::vector<PartInfo> parts;
    std::string marker;
    for (;;) {
        std::string query = "max-parts=" + std::to_string(kListPartsPageSize);
        if (!marker.empty()) {
            query += "&part-number-marker=" + marker;
        }
        query += "&uploadId=" + S3Signer::uriEncode(uploadId, true);

        auto resp = pImpl->perform("GET", objectUrl(key, query), {});
        if (!resp) {
            return resp.error();
        }
        const auto& r = resp.value();
        if (!Impl::isSuccess(r.statusCode)) {
            auto err = Impl::classify(r, "ListParts");
            if (r.statusCode == HTTP_NOT_FOUND) {
                err.code = ErrorCode::DestinationUploadExpired;
            }
            return err;
        }

        auto page = parseListPartsResult(r.body);
        parts.insert(parts.end(), page.parts.begin(), page.parts.end());
        if (!page.truncated || page.nextMarker.empty()) {
            break;
        }
        marker = page.nextMarker;
    }

    std::sort(parts.begin(), parts.end(),
              [](const PartInfo& a, const PartInfo& b) { return a.index < b.index; });
    return parts;
}

Result<std::optional<std::uint64_t>> S3DestinationWriter::stat(std::string_view key) {
    auto resp = pImpl->perform("HEAD", objectUrl(key, {}), {});
    if (!resp) {
        return resp.error();
    }
    const auto& r = resp.value();
    if (r.statusCode == HTTP_NOT_FOUND) {
        return std::optional<std::uint64_t>{};
    }
    if (!Impl::isSuccess(r.statusCode)) {
        return Impl::classify(r, "HeadObject");
    }
    auto it = r.headers.find("content-length");
    if (it == r.headers.end()) {
        return std::optional<std::uint64_t>{};
    }
    try {
        return std::optional<std::uint64_t>{std::stoull(it->second)};
    } catch (const std::exception&) {
        return Error{ErrorCode::DestinationUnreachable,
                     "HeadObject: invalid Content-Length '" + it->second + "'"};
    }
}

} // namespace sluice::storage
