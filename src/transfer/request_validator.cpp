#include <sluice/transfer/transfer.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace sluice::transfer {

namespace {

constexpr std::size_t kMaxIdempotencyKeyLength = 128;

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool hasControlChars(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return c < 0x20 || c == 0x7f; });
}

std::string percentDecode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            unsigned value = 0;
            auto res = std::from_chars(s.data() + i + 1, s.data() + i + 3, value, 16);
            if (res.ec == std::errc() && res.ptr == s.data() + i + 3) {
                out.push_back(static_cast<char>(value));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

// Last path component, stripped of anything that could escape the destination prefix
std::optional<std::string> sanitizeFilename(std::string name) {
    auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    name.erase(std::remove_if(name.begin(), name.end(),
                              [](unsigned char c) { return c < 0x20 || c == 0x7f; }),
               name.end());
    auto trimmed = std::string(trimView(name));
    if (trimmed.empty() || trimmed == "." || trimmed == "..") {
        return std::nullopt;
    }
    return trimmed;
}

Result<void> validateSourceUrl(std::string_view url) {
    if (url.empty()) {
        return Error{ErrorCode::InvalidRequest, "Source url is required"};
    }
    if (hasControlChars(url) || url.find(' ') != std::string_view::npos) {
        return Error{ErrorCode::InvalidRequest, "Source url contains whitespace or control characters"};
    }
    auto pos = url.find("://");
    if (pos == std::string_view::npos) {
        return Error{ErrorCode::InvalidRequest, "Source url has no scheme: " + std::string(url)};
    }
    auto scheme = to_lower(url.substr(0, pos));
    if (scheme != "http" && scheme != "https") {
        return Error{ErrorCode::InvalidRequest, "Unsupported source scheme: " + scheme};
    }
    auto rest = url.substr(pos + 3);
    auto hostEnd = rest.find_first_of("/?#");
    auto authority = rest.substr(0, hostEnd);
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty() || authority.front() == ':') {
        return Error{ErrorCode::InvalidRequest, "Source url has no host: " + std::string(url)};
    }
    return {};
}

// S3 bucket naming: 3-63 chars of [a-z0-9.-], starting and ending alphanumeric
bool isValidBucketName(std::string_view bucket) {
    if (bucket.size() < 3 || bucket.size() > 63) {
        return false;
    }
    auto alnum = [](unsigned char c) { return std::islower(c) || std::isdigit(c); };
    if (!alnum(bucket.front()) || !alnum(bucket.back())) {
        return false;
    }
    return std::all_of(bucket.begin(), bucket.end(), [&](unsigned char c) {
        return alnum(c) || c == '.' || c == '-';
    });
}

Result<void> validateDestination(const storage::DestinationLocation& loc, std::string_view url) {
    switch (loc.scheme) {
        case storage::DestinationScheme::S3:
            if (!isValidBucketName(loc.container)) {
                return Error{ErrorCode::InvalidRequest,
                             "Malformed bucket name '" + loc.container + "' in " + std::string(url)};
            }
            break;
        case storage::DestinationScheme::Memory:
        case storage::DestinationScheme::Filesystem:
            if (loc.container.empty()) {
                return Error{ErrorCode::InvalidRequest,
                             "Destination has no container: " + std::string(url)};
            }
            break;
    }
    if (hasControlChars(loc.key)) {
        return Error{ErrorCode::InvalidRequest, "Destination key contains control characters"};
    }
    if (!loc.key.empty() && loc.key.front() == '/') {
        return Error{ErrorCode::InvalidRequest, "Destination key must not start with '/'"};
    }
    std::string_view rest = loc.key;
    while (!rest.empty()) {
        auto slash = rest.find('/');
        auto segment = rest.substr(0, slash);
        if (segment == "..") {
            return Error{ErrorCode::InvalidRequest, "Destination key must not contain '..'"};
        }
        if (slash == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(slash + 1);
    }
    return {};
}

bool isSafeKeyChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.';
}

// Adds value * msPerUnit to totalMs; false when the sum does not fit in milliseconds
bool addDuration(std::uint64_t value, std::uint64_t msPerUnit, std::uint64_t& totalMs) {
    constexpr auto kMaxMs =
        static_cast<std::uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max());
    if (value > kMaxMs / msPerUnit) {
        return false;
    }
    auto add = value * msPerUnit;
    if (add > kMaxMs - totalMs) {
        return false;
    }
    totalMs += add;
    return true;
}

} // namespace

Result<std::chrono::milliseconds> parseHumanDuration(std::string_view text) {
    auto s = trimView(text);
    if (s.empty()) {
        return Error{ErrorCode::InvalidRequest, "Empty duration"};
    }

    // Bare number: seconds
    {
        std::uint64_t seconds = 0;
        auto res = std::from_chars(s.data(), s.data() + s.size(), seconds);
        if (res.ec == std::errc() && res.ptr == s.data() + s.size()) {
            if (seconds == 0) {
                return Error{ErrorCode::InvalidRequest, "Duration must be positive"};
            }
            std::uint64_t ms = 0;
            if (!addDuration(seconds, 1000, ms)) {
                return Error{ErrorCode::InvalidRequest, "Duration too large: " + std::string(text)};
            }
            return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
        }
    }

    std::uint64_t totalMs = 0;
    while (!s.empty()) {
        s = trimView(s);
        if (s.empty()) {
            break;
        }
        std::uint64_t value = 0;
        auto res = std::from_chars(s.data(), s.data() + s.size(), value);
        if (res.ec != std::errc()) {
            return Error{ErrorCode::InvalidRequest, "Invalid duration: " + std::string(text)};
        }
        s.remove_prefix(static_cast<std::size_t>(res.ptr - s.data()));
        s = trimView(s);

        std::size_t unitLen = 0;
        while (unitLen < s.size() && std::isalpha(static_cast<unsigned char>(s[unitLen]))) {
            ++unitLen;
        }
        auto unit = to_lower(s.substr(0, unitLen));
        s.remove_prefix(unitLen);

        std::uint64_t msPerUnit = 0;
        if (unit == "ms") {
            msPerUnit = 1;
        } else if (unit == "s" || unit == "sec" || unit == "secs") {
            msPerUnit = 1000;
        } else if (unit == "m" || unit == "min" || unit == "mins") {
            msPerUnit = 60 * 1000;
        } else if (unit == "h" || unit == "hr" || unit == "hrs") {
            msPerUnit = 60 * 60 * 1000;
        } else if (unit == "d") {
            msPerUnit = 24 * 60 * 60 * 1000;
        } else {
            return Error{ErrorCode::InvalidRequest,
                         "Invalid duration unit '" + unit + "' in " + std::string(text)};
        }
        if (!addDuration(value, msPerUnit, totalMs)) {
            return Error{ErrorCode::InvalidRequest, "Duration too large: " + std::string(text)};
        }
    }

    if (totalMs == 0) {
        return Error{ErrorCode::InvalidRequest, "Duration must be positive"};
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(totalMs));
}

std::optional<std::string> filenameFromContentDisposition(std::string_view header) {
    std::optional<std::string> plain;
    std::optional<std::string> extended;

    std::string_view rest = header;
    while (!rest.empty()) {
        // Split on ';' outside quotes
        std::size_t end = 0;
        bool quoted = false;
        for (; end < rest.size(); ++end) {
            if (rest[end] == '"') {
                quoted = !quoted;
            } else if (rest[end] == '\\' && quoted && end + 1 < rest.size()) {
                ++end;
            } else if (rest[end] == ';' && !quoted) {
                break;
            }
        }
        auto param = trimView(rest.substr(0, end));
        rest = end < rest.size() ? rest.substr(end + 1) : std::string_view{};

        auto eq = param.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        auto name = to_lower(trimView(param.substr(0, eq)));
        auto value = trimView(param.substr(eq + 1));

        if (name == "filename*") {
            // RFC 5987: charset'language'percent-encoded
            auto first = value.find('\'');
            auto second =
                first == std::string_view::npos ? first : value.find('\'', first + 1);
            if (second != std::string_view::npos) {
                extended = percentDecode(value.substr(second + 1));
            }
        } else if (name == "filename") {
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                std::string unquoted;
                for (std::size_t i = 1; i + 1 < value.size(); ++i) {
                    if (value[i] == '\\' && i + 2 < value.size()) {
                        ++i;
                    }
                    unquoted.push_back(value[i]);
                }
                plain = std::move(unquoted);
            } else {
                plain = std::string(value);
            }
        }
    }

    if (extended) {
        if (auto name = sanitizeFilename(*extended)) {
            return name;
        }
    }
    if (plain) {
        return sanitizeFilename(*plain);
    }
    return std::nullopt;
}

std::string resolveObjectKey(std::string_view prefix, const SourceInfo& info,
                             std::string_view sourceUrl) {
    std::optional<std::string> name;
    if (info.contentDisposition) {
        name = filenameFromContentDisposition(*info.contentDisposition);
    }
    if (!name) {
        auto path = sourceUrl;
        if (auto scheme = path.find("://"); scheme != std::string_view::npos) {
            path.remove_prefix(scheme + 3);
        }
        auto slash = path.find('/');
        path = slash == std::string_view::npos ? std::string_view{} : path.substr(slash);
        path = path.substr(0, path.find_first_of("?#"));
        auto last = path.find_last_of('/');
        if (last != std::string_view::npos) {
            name = sanitizeFilename(percentDecode(path.substr(last + 1)));
        }
    }
    return std::string(prefix) + name.value_or("download");
}

Result<ValidatedRequest> validateRequest(const TransferRequest& request) {
    if (auto r = validateSourceUrl(request.url); !r) {
        return r.error();
    }

    if (request.output.url.empty()) {
        return Error{ErrorCode::InvalidRequest, "output.url is required"};
    }
    auto location = storage::DestinationWriterFactory::parseLocation(request.output.url);
    if (!location) {
        return location.error();
    }
    if (auto r = validateDestination(location.value(), request.output.url); !r) {
        return r.error();
    }

    for (const auto& h : request.headers) {
        if (h.name.empty() || hasControlChars(h.name) || hasControlChars(h.value) ||
            h.name.find(':') != std::string::npos) {
            return Error{ErrorCode::InvalidRequest, "Malformed request header '" + h.name + "'"};
        }
        if (to_lower(h.name) == "range") {
            return Error{ErrorCode::InvalidRequest, "The Range header is managed by the transfer"};
        }
    }

    if (request.timeout && request.timeout->count() <= 0) {
        return Error{ErrorCode::InvalidRequest, "request.timeout must be positive"};
    }

    if (request.idempotencyKey) {
        const auto& key = *request.idempotencyKey;
        if (key.empty() || key.size() > kMaxIdempotencyKeyLength ||
            !std::all_of(key.begin(), key.end(),
                         [](unsigned char c) { return isSafeKeyChar(c); })) {
            return Error{ErrorCode::InvalidRequest,
                         "idempotencyKey must be 1-128 characters of [A-Za-z0-9._-]"};
        }
    }
    if (request.invocationId && request.invocationId->empty()) {
        return Error{ErrorCode::InvalidRequest, "invocation id must not be empty"};
    }

    ValidatedRequest out;
    out.sourceUrl = request.url;
    out.destination = std::move(location).value();
    out.headers = request.headers;
    out.timeout = request.timeout;
    out.setContentType = request.output.setContentType;
    out.contentType = request.output.contentType;
    out.idempotencyKey = request.idempotencyKey;
    out.invocationId = request.invocationId;
    out.restart = request.restart;
    return out;
}

} // namespace sluice::transfer
