#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "destination_writer.h"
#include <sluice/core/types.h>

namespace sluice::storage {

class S3Signer {
public:
    // SHA-256 of the empty string
    static constexpr const char* kEmptyPayloadSha256 =
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

    /**
     * Sign the request using AWS Signature Version 4
     * method: HTTP method ("GET", "PUT", etc.)
     * url: full request URL (https://host/encoded/path[?query]); path and query already encoded
     * payloadSha256: lower-case hex SHA-256 of the request body
     * extraHeaders: additional headers to sign and send (e.g. content-type, range)
     * now: signing time (defaults to the current time)
     * Returns "Name: value" header lines ready for CURLOPT_HTTPHEADER, Authorization last.
     */
    static Result<std::vector<std::string>>
    signRequest(const S3Config& config, const std::string& method, const std::string& url,
                std::string_view payloadSha256,
                const std::vector<std::pair<std::string, std::string>>& extraHeaders = {},
                std::optional<std::chrono::system_clock::time_point> now = std::nullopt);

    // RFC 3986 percent-encoding as required by SigV4 (unreserved characters kept)
    static std::string uriEncode(std::string_view s, bool encodeSlash);

    // Sort query parameters by name; bare names become "name="
    static std::string canonicalQuery(std::string_view query);
};

} // namespace sluice::storage
