#include <sluice/storage/s3_signer.h>

#include <sluice/crypto/hasher.h>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <sstream>

namespace sluice::storage {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

std::string hexEncode(const unsigned char* data, std::size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = hex[(data[i] >> 4) & 0xF];
        out[2 * i + 1] = hex[data[i] & 0xF];
    }
    return out;
}

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string path;  // begins with '/'
    std::string query; // without leading '?'
};

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl pu;
    auto pos = url.find("://");
    if (pos == std::string::npos)
        return pu;
    pu.scheme = url.substr(0, pos);
    auto rest = url.substr(pos + 3);
    auto slash = rest.find_first_of("/?");
    if (slash == std::string::npos) {
        pu.host = rest;
        pu.path = "/";
        return pu;
    }
    pu.host = rest.substr(0, slash);
    auto pathQuery = rest.substr(slash);
    auto qpos = pathQuery.find('?');
    if (qpos == std::string::npos) {
        pu.path = pathQuery;
    } else {
        pu.path = pathQuery.substr(0, qpos);
        pu.query = pathQuery.substr(qpos + 1);
    }
    if (pu.path.empty())
        pu.path = "/";
    return pu;
}

std::string formatAmzDate(std::chrono::system_clock::time_point now, std::string* outShortDate) {
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm gmt{};
    gmtime_r(&t, &gmt);
    char bufTs[32];
    char bufD[16];
    if (std::strftime(bufTs, sizeof(bufTs), "%Y%m%dT%H%M%SZ", &gmt) == 0) {
        return {};
    }
    if (outShortDate) {
        *outShortDate = std::strftime(bufD, sizeof(bufD), "%Y%m%d", &gmt) == 0 ? "" : bufD;
    }
    return std::string(bufTs);
}

std::array<unsigned char, 32> hmacSha256(std::string_view key, std::string_view data) {
    std::array<unsigned char, 32> out{};
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), (int)key.size(), (const unsigned char*)data.data(),
         data.size(), out.data(), &len);
    return out;
}

std::string_view asView(const std::array<unsigned char, 32>& a) {
    return std::string_view(reinterpret_cast<const char*>(a.data()), a.size());
}

std::string trimValue(const std::string& value) {
    auto start = value.find_first_not_of(" \t\r\n");
    auto end = value.find_last_not_of(" \t\r\n");
    return start == std::string::npos ? std::string() : value.substr(start, end - start + 1);
}

} // namespace

std::string S3Signer::uriEncode(std::string_view s, bool encodeSlash) {
    static const char* unreserved =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_.~";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c != 0 && std::strchr(unreserved, c)) || (!encodeSlash && c == '/')) {
            out.push_back((char)c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

std::string S3Signer::canonicalQuery(std::string_view query) {
    if (query.empty())
        return {};
    std::vector<std::pair<std::string, std::string>> params;
    std::size_t start = 0;
    while (start <= query.size()) {
        auto amp = query.find('&', start);
        auto item = query.substr(start, amp == std::string_view::npos ? std::string_view::npos
                                                                      : amp - start);
        if (!item.empty()) {
            auto eq = item.find('=');
            if (eq == std::string_view::npos) {
                params.emplace_back(std::string(item), std::string());
            } else {
                params.emplace_back(std::string(item.substr(0, eq)),
                                    std::string(item.substr(eq + 1)));
            }
        }
        if (amp == std::string_view::npos)
            break;
        start = amp + 1;
    }
    std::sort(params.begin(), params.end());

    std::string out;
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0)
            out.push_back('&');
        out += params[i].first;
        out.push_back('=');
        out += params[i].second;
    }
    return out;
}

Result<std::vector<std::string>>
S3Signer::signRequest(const S3Config& config, const std::string& method, const std::string& url,
                      std::string_view payloadSha256,
                      const std::vector<std::pair<std::string, std::string>>& extraHeaders,
                      std::optional<std::chrono::system_clock::time_point> now) {
    // Resolve credentials
    std::string accessKey;
    std::string secretKey;
    std::string sessionToken;

    if (auto it = config.credentials.find("access_key"); it != config.credentials.end()) {
        accessKey = it->second;
    }
    if (auto it = config.credentials.find("secret_key"); it != config.credentials.end()) {
        secretKey = it->second;
    }
    if (auto it = config.credentials.find("session_token"); it != config.credentials.end()) {
        sessionToken = it->second;
    }

    if (accessKey.empty() || secretKey.empty()) {
        const char* ak = std::getenv("AWS_ACCESS_KEY_ID");
        const char* sk = std::getenv("AWS_SECRET_ACCESS_KEY");
        const char* st = std::getenv("AWS_SESSION_TOKEN");
        if (ak)
            accessKey = ak;
        if (sk)
            secretKey = sk;
        if (st)
            sessionToken = st;
    }

    if (accessKey.empty() || secretKey.empty()) {
        return Error{ErrorCode::DestinationDenied, "Missing S3 credentials"};
    }

    const std::string region = config.region.empty() ? std::string("us-east-1") : config.region;
    const std::string service = "s3";
    ParsedUrl pu = parseUrl(url);
    if (pu.host.empty()) {
        return Error{ErrorCode::InvalidRequest, "Cannot sign malformed URL: " + url};
    }

    const std::string payloadHex =
        payloadSha256.empty() ? std::string(kEmptyPayloadSha256) : std::string(payloadSha256);

    std::string ymd;
    std::string amzDate = formatAmzDate(now.value_or(std::chrono::system_clock::now()), &ymd);

    // Headers (canonical set)
    std::vector<std::pair<std::string, std::string>> hdrs;
    hdrs.emplace_back("host", toLower(pu.host));
    hdrs.emplace_back("x-amz-content-sha256", payloadHex);
    hdrs.emplace_back("x-amz-date", amzDate);
    if (!sessionToken.empty())
        hdrs.emplace_back("x-amz-security-token", sessionToken);
    for (const auto& [name, value] : extraHeaders) {
        hdrs.emplace_back(toLower(name), trimValue(value));
    }
    std::sort(hdrs.begin(), hdrs.end(), [](auto& a, auto& b) { return a.first < b.first; });

    std::ostringstream canonicalHeaders;
    std::ostringstream signedHeaders;
    for (size_t i = 0; i < hdrs.size(); ++i) {
        canonicalHeaders << hdrs[i].first << ':' << hdrs[i].second << "\n";
        signedHeaders << hdrs[i].first;
        if (i + 1 < hdrs.size())
            signedHeaders << ';';
    }

    // S3 paths are encoded once by the caller; they are not re-encoded here.
    std::ostringstream cr;
    cr << method << "\n"
       << pu.path << "\n"
       << canonicalQuery(pu.query) << "\n"
       << canonicalHeaders.str() << "\n"
       << signedHeaders.str() << "\n"
       << payloadHex;
    const std::string canonicalRequest = cr.str();

    std::ostringstream sts;
    sts << "AWS4-HMAC-SHA256\n"
        << amzDate << "\n"
        << ymd << '/' << region << '/' << service << "/aws4_request\n"
        << crypto::SHA256Hasher::hash(canonicalRequest);
    const std::string stringToSign = sts.str();

    // Derive signing key
    std::string kSecret = "AWS4" + secretKey;
    auto kDate = hmacSha256(kSecret, ymd);
    auto kRegion = hmacSha256(asView(kDate), region);
    auto kService = hmacSha256(asView(kRegion), service);
    auto kSigning = hmacSha256(asView(kService), "aws4_request");
    auto sig = hmacSha256(asView(kSigning), stringToSign);
    std::string signature = hexEncode(sig.data(), sig.size());

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 Credential=" << accessKey << '/' << ymd << '/' << region << '/'
         << service << "/aws4_request,SignedHeaders=" << signedHeaders.str()
         << ",Signature=" << signature;

    std::vector<std::string> lines;
    lines.push_back("Host: " + pu.host);
    lines.push_back("x-amz-date: " + amzDate);
    lines.push_back("x-amz-content-sha256: " + payloadHex);
    if (!sessionToken.empty()) {
        lines.push_back("x-amz-security-token: " + sessionToken);
    }
    for (const auto& [name, value] : extraHeaders) {
        lines.push_back(name + ": " + value);
    }
    lines.push_back("Authorization: " + auth.str());
    return lines;
}

} // namespace sluice::storage
