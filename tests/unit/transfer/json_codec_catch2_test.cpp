#include <catch2/catch_test_macros.hpp>

#include <sluice/transfer/json_codec.hpp>

using namespace sluice;
using namespace sluice::transfer;
using json = nlohmann::json;

namespace {
TransferState sampleState() {
    TransferState s;
    s.key = "k1";
    s.attempt = 2;
    s.source = "https://example.com/a";
    s.destination = "s3://bucket/in/";
    s.resolvedKey = "in/a";
    s.chunkSize = 8u * 1024 * 1024;
    s.bytesTransferred = 16u * 1024 * 1024;
    s.sourceCursor = s.bytesTransferred;
    s.totalBytes = 20u * 1024 * 1024;
    s.validator.etag = "\"abc\"";
    s.contentType = "application/octet-stream";
    s.resumeToken = ResumeToken{"upload-1",
                                {{1, 8u * 1024 * 1024, "\"e1\"", "aa"},
                                 {2, 8u * 1024 * 1024, "\"e2\"", "bb"}}};
    return s;
}
} // namespace

TEST_CASE("TransferState survives serialization", "[transfer][json]") {
    auto original = sampleState();
    auto j = stateToJson(original);
    CHECK(j["version"] == 1);
    CHECK(j["status"] == "in_progress");
    CHECK(j["resumeToken"]["parts"].size() == 2);
    CHECK_FALSE(j.contains("error"));

    auto parsed = stateFromJson(json::parse(j.dump()));
    REQUIRE(parsed);
    const auto& s = parsed.value();
    CHECK(s.key == "k1");
    CHECK(s.attempt == 2);
    CHECK(s.resolvedKey == "in/a");
    CHECK(s.bytesTransferred == original.bytesTransferred);
    CHECK(s.totalBytes == original.totalBytes);
    CHECK(s.validator.etag == original.validator.etag);
    CHECK_FALSE(s.validator.lastModified.has_value());
    REQUIRE(s.resumeToken);
    CHECK(s.resumeToken->uploadId == "upload-1");
    CHECK(s.resumeToken->parts[1].sha256 == "bb");
}

TEST_CASE("Failed state keeps its error kind", "[transfer][json]") {
    auto state = sampleState();
    state.status = TransferStatus::Failed;
    state.resumeToken.reset();
    state.error = Error{ErrorCode::DestinationDenied, "403 AccessDenied"};

    auto j = stateToJson(state);
    CHECK(j["error"]["kind"] == "destination_denied");
    auto parsed = stateFromJson(j);
    REQUIRE(parsed);
    CHECK(parsed.value().status == TransferStatus::Failed);
    REQUIRE(parsed.value().error);
    CHECK(parsed.value().error->code == ErrorCode::DestinationDenied);
    CHECK(parsed.value().error->message == "403 AccessDenied");
}

TEST_CASE("Corrupt state documents are StateCorruption", "[transfer][json]") {
    auto good = stateToJson(sampleState());

    auto wrongVersion = good;
    wrongVersion["version"] = 99;
    auto badStatus = good;
    badStatus["status"] = "paused";
    auto cursorAhead = good;
    cursorAhead["sourceCursor"] = 999999999999ull;
    auto missingKey = good;
    missingKey.erase("key");
    auto wrongType = good;
    wrongType["bytesTransferred"] = "lots";
    auto partsOverChunk = good;
    partsOverChunk["chunkSize"] = 1024;

    for (const auto& doc : {json::array(), wrongVersion, badStatus, cursorAhead, missingKey,
                            wrongType, partsOverChunk}) {
        auto r = stateFromJson(doc);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::StateCorruption);
    }
}

TEST_CASE("Request JSON in the service shape", "[transfer][json]") {
    auto r = requestFromJsonText(R"({
        "url": "https://example.com/a.bin",
        "request": {"headers": {"Authorization": "Bearer t"}, "timeout": "1h 30m"},
        "output": {"url": "s3://bucket/out/", "setContentType": true},
        "idempotencyKey": "job-1",
        "restart": true
    })");
    REQUIRE(r);
    CHECK(r.value().url == "https://example.com/a.bin");
    REQUIRE(r.value().headers.size() == 1);
    CHECK(r.value().headers[0].name == "Authorization");
    CHECK(r.value().timeout == std::optional<std::chrono::milliseconds>{std::chrono::minutes(90)});
    CHECK(r.value().output.url == "s3://bucket/out/");
    CHECK(r.value().output.setContentType);
    CHECK(r.value().idempotencyKey == std::optional<std::string>{"job-1"});
    CHECK(r.value().restart);

    auto numericTimeout = requestFromJsonText(
        R"({"url": "https://e/a", "request": {"timeout": 30}, "output": {"url": "/tmp/a"}})");
    REQUIRE(numericTimeout);
    CHECK(numericTimeout.value().timeout ==
          std::optional<std::chrono::milliseconds>{std::chrono::seconds(30)});

    auto roundTrip = requestFromJson(requestToJson(r.value()));
    REQUIRE(roundTrip);
    CHECK(roundTrip.value().timeout == r.value().timeout);
    CHECK(roundTrip.value().output.url == r.value().output.url);
}

TEST_CASE("Malformed request JSON is InvalidRequest", "[transfer][json]") {
    for (const char* text : {"not json", "[]", R"({"url": "https://e/a"})",
                             R"({"url": "https://e/a", "output": "s3://b/k"})",
                             R"({"url": "https://e/a", "output": {"url": "s3://b/k"},
                                 "request": {"headers": ["a"]}})",
                             R"({"url": "https://e/a", "output": {"url": "s3://b/k"},
                                 "request": {"timeout": "soon"}})"}) {
        INFO(text);
        auto r = requestFromJsonText(text);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidRequest);
    }
}

TEST_CASE("Response JSON shapes", "[transfer][json]") {
    TransferResult result{"k", 42, "s3://bucket/key", 1, false};
    auto ok = resultToJson(result);
    CHECK(ok == json{{"size", 42}, {"location", "s3://bucket/key"}, {"status", "completed"}});

    auto err = errorToJson(Error{ErrorCode::SourceNotFound, "404"});
    CHECK(err["error"]["kind"] == "source_not_found");
    CHECK(err["error"]["message"] == "404");
}
