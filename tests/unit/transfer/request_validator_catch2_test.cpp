// Request validation, durations, Content-Disposition names and idempotency keys

#include <catch2/catch_test_macros.hpp>

#include <sluice/crypto/hasher.h>
#include <sluice/transfer/transfer.hpp>

using namespace sluice;
using namespace sluice::transfer;
using namespace std::chrono_literals;

namespace {
TransferRequest request(std::string url, std::string output) {
    TransferRequest r;
    r.url = std::move(url);
    r.output.url = std::move(output);
    return r;
}

ErrorCode codeOf(const TransferRequest& r) {
    auto v = validateRequest(r);
    return v ? ErrorCode::Success : v.error().code;
}
} // namespace

TEST_CASE("validateRequest accepts well-formed requests", "[transfer][validator]") {
    auto r = request("https://example.com/files/a.tar.gz", "s3://my-bucket/in/a.tar.gz");
    r.headers.push_back({"Authorization", "Bearer x"});
    r.timeout = 10min;
    r.output.contentType = "application/gzip";

    auto v = validateRequest(r);
    REQUIRE(v);
    CHECK(v.value().sourceUrl == r.url);
    CHECK(v.value().destination.container == "my-bucket");
    CHECK(v.value().destination.key == "in/a.tar.gz");
    CHECK(v.value().headers.size() == 1);
    CHECK(v.value().timeout == std::optional<std::chrono::milliseconds>{10min});
    CHECK(v.value().contentType == std::optional<std::string>("application/gzip"));
    // The override only applies once setting the type is requested
    CHECK_FALSE(v.value().setContentType);

    r.output.setContentType = true;
    auto typed = validateRequest(r);
    REQUIRE(typed);
    CHECK(typed.value().setContentType);
}

TEST_CASE("validateRequest accepts a bucket root as a prefix", "[transfer][validator]") {
    auto v = validateRequest(request("https://example.com/files/a.tar.gz", "s3://my-bucket"));
    REQUIRE(v);
    CHECK(v.value().destination.container == "my-bucket");
    CHECK(v.value().destination.isPrefix());
    CHECK(v.value().destination.urlForKey("a.tar.gz") == "s3://my-bucket/a.tar.gz");
}

TEST_CASE("validateRequest rejects malformed requests before any I/O", "[transfer][validator]") {
    CHECK(codeOf(request("", "s3://bucket/k")) == ErrorCode::InvalidRequest);
    CHECK(codeOf(request("ftp://example.com/a", "s3://bucket/k")) == ErrorCode::InvalidRequest);
    CHECK(codeOf(request("https://", "s3://bucket/k")) == ErrorCode::InvalidRequest);
    CHECK(codeOf(request("https://exa mple.com/a", "s3://bucket/k")) == ErrorCode::InvalidRequest);
    CHECK(codeOf(request("https://example.com/a", "")) == ErrorCode::InvalidRequest);
    CHECK(codeOf(request("https://example.com/a", "gs://bucket/k")) == ErrorCode::InvalidRequest);
    CHECK(codeOf(request("https://example.com/a", "s3://Bad_Bucket/k")) ==
          ErrorCode::InvalidRequest);
    CHECK(codeOf(request("https://example.com/a", "s3://ab/k")) == ErrorCode::InvalidRequest);
    CHECK(codeOf(request("https://example.com/a", "s3://bucket/../k")) ==
          ErrorCode::InvalidRequest);

    auto rangeHeader = request("https://example.com/a", "s3://bucket/k");
    rangeHeader.headers.push_back({"Range", "bytes=0-"});
    CHECK(codeOf(rangeHeader) == ErrorCode::InvalidRequest);

    auto badHeader = request("https://example.com/a", "s3://bucket/k");
    badHeader.headers.push_back({"X-Bad:Name", "v"});
    CHECK(codeOf(badHeader) == ErrorCode::InvalidRequest);

    auto zeroTimeout = request("https://example.com/a", "s3://bucket/k");
    zeroTimeout.timeout = 0ms;
    CHECK(codeOf(zeroTimeout) == ErrorCode::InvalidRequest);

    auto badKey = request("https://example.com/a", "s3://bucket/k");
    badKey.idempotencyKey = "has space";
    CHECK(codeOf(badKey) == ErrorCode::InvalidRequest);
    badKey.idempotencyKey = std::string(129, 'a');
    CHECK(codeOf(badKey) == ErrorCode::InvalidRequest);
    badKey.idempotencyKey = "job-42.v1_a";
    CHECK(codeOf(badKey) == ErrorCode::Success);
}

TEST_CASE("parseHumanDuration", "[transfer][duration]") {
    CHECK(parseHumanDuration("45s").value() == 45s);
    CHECK(parseHumanDuration("10m").value() == 10min);
    CHECK(parseHumanDuration("1h 30m").value() == 90min);
    CHECK(parseHumanDuration("250ms").value() == 250ms);
    CHECK(parseHumanDuration("2h").value() == 2h);
    CHECK(parseHumanDuration("1d").value() == 24h);
    CHECK(parseHumanDuration("90").value() == 90s);

    CHECK_FALSE(parseHumanDuration(""));
    CHECK_FALSE(parseHumanDuration("0"));
    CHECK_FALSE(parseHumanDuration("10 fortnights"));
    CHECK_FALSE(parseHumanDuration("abc"));

    // values that do not fit in milliseconds are rejected, not wrapped
    for (const char* huge : {"18446744073709551615", "9223372036854775807s",
                             "99999999999999999999h", "300000000000d", "1h 18446744073709551615ms"}) {
        INFO(huge);
        auto d = parseHumanDuration(huge);
        REQUIRE_FALSE(d);
        CHECK(d.error().code == ErrorCode::InvalidRequest);
    }
    CHECK(parseHumanDuration("36500d").value() == 36500 * 24h);
}

TEST_CASE("filenameFromContentDisposition", "[transfer][disposition]") {
    CHECK(filenameFromContentDisposition("attachment; filename=\"report.pdf\"") ==
          std::optional<std::string>{"report.pdf"});
    CHECK(filenameFromContentDisposition("attachment; filename=plain.txt") ==
          std::optional<std::string>{"plain.txt"});
    CHECK(filenameFromContentDisposition(
              "attachment; filename=\"fallback.txt\"; filename*=UTF-8''na%C3%AFve%20file.txt") ==
          std::optional<std::string>{"na\xC3\xAFve file.txt"});
    CHECK(filenameFromContentDisposition("attachment; filename=\"../../etc/passwd\"") ==
          std::optional<std::string>{"passwd"});
    CHECK_FALSE(filenameFromContentDisposition("inline").has_value());
    CHECK_FALSE(filenameFromContentDisposition("attachment; filename=\"..\"").has_value());
}

TEST_CASE("resolveObjectKey prefers disposition, then URL path, then a default",
          "[transfer][disposition]") {
    SourceInfo info;
    info.contentDisposition = "attachment; filename=\"data.csv\"";
    CHECK(resolveObjectKey("in/", info, "https://h/x/y.bin") == "in/data.csv");

    SourceInfo none;
    CHECK(resolveObjectKey("in/", none, "https://h/x/y%20z.bin?sig=1") == "in/y z.bin");
    CHECK(resolveObjectKey("in/", none, "https://h/") == "in/download");
    CHECK(resolveObjectKey("", none, "https://h") == "download");
}

TEST_CASE("Content idempotency key is stable per source and destination",
          "[transfer][idempotency]") {
    auto a = validateRequest(request("https://example.com/a", "s3://bucket/k"));
    auto b = validateRequest(request("https://example.com/a", "s3://bucket/k"));
    auto c = validateRequest(request("https://example.com/a", "s3://bucket/other"));
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(c);

    auto ka = deriveIdempotencyKey(a.value(), IdempotencyPolicy::Content);
    auto kb = deriveIdempotencyKey(b.value(), IdempotencyPolicy::Content);
    auto kc = deriveIdempotencyKey(c.value(), IdempotencyPolicy::Content);
    REQUIRE(ka);
    CHECK(ka.value() == kb.value());
    CHECK(ka.value() != kc.value());
    CHECK(ka.value() == crypto::SHA256Hasher::hash(
                            std::string_view{"v1\nhttps://example.com/a\ns3://bucket/k"}));
}

TEST_CASE("Invocation idempotency requires an invocation id", "[transfer][idempotency]") {
    auto r = request("https://example.com/a", "s3://bucket/k");
    auto v = validateRequest(r);
    REQUIRE(v);
    auto missing = deriveIdempotencyKey(v.value(), IdempotencyPolicy::Invocation);
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::InvalidRequest);

    r.invocationId = "workflow-7/step-3";
    auto withId = validateRequest(r);
    REQUIRE(withId);
    auto k = deriveIdempotencyKey(withId.value(), IdempotencyPolicy::Invocation);
    REQUIRE(k);
    CHECK(k.value() == crypto::SHA256Hasher::hash(std::string_view{"workflow-7/step-3"}));

    r.idempotencyKey = "explicit-key";
    auto explicitKey = validateRequest(r);
    REQUIRE(explicitKey);
    CHECK(deriveIdempotencyKey(explicitKey.value(), IdempotencyPolicy::Invocation).value() ==
          "explicit-key");
}
