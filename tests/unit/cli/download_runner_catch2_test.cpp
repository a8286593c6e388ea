// Retry policy, exit codes and request-list parsing of the download command

#include <catch2/catch_test_macros.hpp>

#include <sluice/cli/download_runner.h>

#include <deque>
#include <map>
#include <mutex>
#include <sstream>

using namespace sluice;
using namespace sluice::cli;
using namespace sluice::transfer;

namespace {

// Replays a scripted sequence of outcomes per source URL
class ScriptedOrchestrator : public ITransferOrchestrator {
public:
    void script(const std::string& url, std::vector<Result<TransferResult>> steps) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& s : steps) {
            scripts_[url].push_back(std::move(s));
        }
    }

    int calls(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(url);
        return it == calls_.end() ? 0 : it->second;
    }

    Result<TransferResult> runTransfer(const TransferRequest& request, const ProgressCallback&,
                                       const ShouldCancel&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_[request.url];
        auto& queue = scripts_[request.url];
        if (queue.empty()) {
            return Error{ErrorCode::InternalError, "script exhausted"};
        }
        auto next = std::move(queue.front());
        queue.pop_front();
        return next;
    }

    Result<std::optional<TransferState>> inspect(const TransferRequest&) override {
        return std::optional<TransferState>{};
    }

    TransferConfig config() const override { return {}; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<Result<TransferResult>>> scripts_;
    std::map<std::string, int> calls_;
};

TransferRequest requestFor(const std::string& url) {
    TransferRequest req;
    req.url = url;
    req.output.url = "mem://box/out";
    return req;
}

TransferResult okResult(std::uint64_t bytes) {
    TransferResult r;
    r.key = "k";
    r.bytesTransferred = bytes;
    r.location = "mem://box/out";
    return r;
}

RetryPolicy fastPolicy(int attempts) {
    RetryPolicy p;
    p.maxAttempts = attempts;
    p.initialBackoff = std::chrono::milliseconds(100);
    p.multiplier = 2.0;
    p.maxBackoff = std::chrono::milliseconds(1000);
    return p;
}

} // namespace

TEST_CASE("Backoff grows exponentially up to the cap", "[cli][retry]") {
    auto p = fastPolicy(10);
    using std::chrono::milliseconds;

    CHECK(backoffDelay(p, 1, 1.0) == milliseconds(100));
    CHECK(backoffDelay(p, 2, 1.0) == milliseconds(200));
    CHECK(backoffDelay(p, 3, 1.0) == milliseconds(400));
    CHECK(backoffDelay(p, 5, 1.0) == milliseconds(1000));
    CHECK(backoffDelay(p, 30, 1.0) == milliseconds(1000));

    // jitter keeps the delay between half and all of the capped value
    CHECK(backoffDelay(p, 2, 0.0) == milliseconds(100));
    CHECK(backoffDelay(p, 2, 0.5) == milliseconds(150));
    CHECK(backoffDelay(p, 2, 7.0) == milliseconds(200));
}

TEST_CASE("Retryable errors are retried until success", "[cli][retry]") {
    ScriptedOrchestrator orch;
    orch.script("https://a/x", {Error{ErrorCode::SourceUnreachable, "reset"},
                                Error{ErrorCode::DestinationUnreachable, "503"}, okResult(10)});

    std::vector<std::chrono::milliseconds> sleeps;
    Sleeper sleeper = [&](std::chrono::milliseconds d, const ShouldCancel&) { sleeps.push_back(d); };

    auto outcome = runWithRetry(orch, requestFor("https://a/x"), fastPolicy(5), {}, {}, sleeper);
    REQUIRE(outcome.ok());
    CHECK(outcome.attempts == 3);
    CHECK(outcome.result->bytesTransferred == 10);
    CHECK_FALSE(outcome.error.has_value());
    REQUIRE(sleeps.size() == 2);
    CHECK(sleeps[0] >= std::chrono::milliseconds(50));
    CHECK(sleeps[0] <= std::chrono::milliseconds(100));
    CHECK(sleeps[1] >= std::chrono::milliseconds(100));
    CHECK(sleeps[1] <= std::chrono::milliseconds(200));
    CHECK(exitCodeFor(outcome) == kExitSuccess);
}

TEST_CASE("Fatal errors are not retried", "[cli][retry]") {
    ScriptedOrchestrator orch;
    orch.script("https://a/x", {Error{ErrorCode::SourceNotFound, "404"}, okResult(1)});
    int sleeps = 0;
    auto outcome = runWithRetry(orch, requestFor("https://a/x"), fastPolicy(5), {}, {},
                                [&](std::chrono::milliseconds, const ShouldCancel&) { ++sleeps; });
    REQUIRE_FALSE(outcome.ok());
    CHECK(outcome.attempts == 1);
    CHECK(sleeps == 0);
    CHECK_FALSE(outcome.exhausted);
    CHECK(exitCodeFor(outcome) == kExitFatal);
}

TEST_CASE("Retries stop at max attempts", "[cli][retry]") {
    ScriptedOrchestrator orch;
    orch.script("https://a/x", {Error{ErrorCode::SourceUnreachable, "1"},
                                Error{ErrorCode::SourceUnreachable, "2"},
                                Error{ErrorCode::SourceUnreachable, "3"}, okResult(1)});
    auto outcome = runWithRetry(orch, requestFor("https://a/x"), fastPolicy(3), {}, {},
                                [](std::chrono::milliseconds, const ShouldCancel&) {});
    REQUIRE_FALSE(outcome.ok());
    CHECK(outcome.exhausted);
    CHECK(outcome.attempts == 3);
    CHECK(orch.calls("https://a/x") == 3);
    CHECK(outcome.error->message == "3");
    CHECK(exitCodeFor(outcome) == kExitRetriesExhausted);
}

TEST_CASE("Cancellation during backoff ends the retry loop", "[cli][retry]") {
    ScriptedOrchestrator orch;
    orch.script("https://a/x", {Error{ErrorCode::SourceUnreachable, "reset"}, okResult(1)});
    bool cancelled = false;
    auto outcome = runWithRetry(
        orch, requestFor("https://a/x"), fastPolicy(5), [&] { return cancelled; }, {},
        [&](std::chrono::milliseconds, const ShouldCancel&) { cancelled = true; });
    REQUIRE_FALSE(outcome.ok());
    REQUIRE(outcome.error.has_value());
    CHECK(outcome.error->code == ErrorCode::OperationCancelled);
    CHECK(orch.calls("https://a/x") == 1);
    CHECK(exitCodeFor(outcome) == kExitRetriesExhausted);
}

TEST_CASE("Interruptible sleep returns early on cancel", "[cli][retry]") {
    auto start = std::chrono::steady_clock::now();
    interruptibleSleep(std::chrono::seconds(10), [] { return true; });
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
}

TEST_CASE("Exit codes map error classes", "[cli][exit]") {
    auto failed = [](ErrorCode code) {
        return RunOutcome{std::nullopt, Error{code, "x"}, 1, false};
    };
    CHECK(exitCodeFor(failed(ErrorCode::InvalidRequest)) == kExitInvalid);
    CHECK(exitCodeFor(failed(ErrorCode::InvalidConfig)) == kExitInvalid);
    CHECK(exitCodeFor(failed(ErrorCode::DestinationDenied)) == kExitFatal);
    CHECK(exitCodeFor(failed(ErrorCode::SourceChanged)) == kExitFatal);
    CHECK(exitCodeFor(failed(ErrorCode::TransferInProgress)) == kExitRetriesExhausted);

    RunOutcome ok{okResult(1), std::nullopt, 1, false};
    CHECK(exitCodeFor(std::vector<RunOutcome>{ok, ok}) == kExitSuccess);
    CHECK(exitCodeFor(std::vector<RunOutcome>{ok, failed(ErrorCode::SourceUnreachable)}) ==
          kExitRetriesExhausted);
    CHECK(exitCodeFor(std::vector<RunOutcome>{failed(ErrorCode::SourceUnreachable),
                                              failed(ErrorCode::SourceNotFound), ok}) ==
          kExitFatal);
    CHECK(exitCodeFor(std::vector<RunOutcome>{failed(ErrorCode::SourceNotFound),
                                              failed(ErrorCode::InvalidRequest)}) == kExitInvalid);
}

TEST_CASE("runMany returns outcomes in input order", "[cli][list]") {
    ScriptedOrchestrator orch;
    std::vector<TransferRequest> requests;
    for (int i = 0; i < 8; ++i) {
        auto url = "https://a/" + std::to_string(i);
        if (i == 5) {
            orch.script(url, {Error{ErrorCode::SourceNotFound, "404"}});
        } else {
            orch.script(url, {okResult(static_cast<std::uint64_t>(i))});
        }
        requests.push_back(requestFor(url));
    }

    auto outcomes = runMany(orch, requests, fastPolicy(1), 3);
    REQUIRE(outcomes.size() == 8);
    for (int i = 0; i < 8; ++i) {
        if (i == 5) {
            CHECK_FALSE(outcomes[i].ok());
        } else {
            REQUIRE(outcomes[i].ok());
            CHECK(outcomes[i].result->bytesTransferred == static_cast<std::uint64_t>(i));
        }
    }
    CHECK(exitCodeFor(outcomes) == kExitFatal);
}

TEST_CASE("Request lists are JSON lines", "[cli][list]") {
    SECTION("comments and blank lines are skipped") {
        std::istringstream in(
            "# nightly mirror\n"
            "{\"url\": \"https://a/1\", \"output\": {\"url\": \"s3://b/1\"}}\n"
            "\n"
            "   \n"
            "{\"url\": \"https://a/2\", \"output\": {\"url\": \"s3://b/\"}, \"restart\": true}\n");
        auto list = parseRequestList(in);
        REQUIRE(list);
        REQUIRE(list.value().size() == 2);
        CHECK(list.value()[0].url == "https://a/1");
        CHECK(list.value()[1].output.url == "s3://b/");
        CHECK(list.value()[1].restart);
    }

    SECTION("errors name the offending line") {
        std::istringstream in("{\"url\": \"https://a/1\", \"output\": {\"url\": \"s3://b/1\"}}\n"
                              "not json\n");
        auto list = parseRequestList(in);
        REQUIRE_FALSE(list);
        CHECK(list.error().code == ErrorCode::InvalidRequest);
        CHECK(list.error().message.rfind("line 2:", 0) == 0);
    }
}

TEST_CASE("Header arguments split on the first colon", "[cli]") {
    auto h = parseHeaderArg("Authorization:  Bearer a:b");
    REQUIRE(h);
    CHECK(h.value().name == "Authorization");
    CHECK(h.value().value == "Bearer a:b");

    auto empty = parseHeaderArg("X-Empty:");
    REQUIRE(empty);
    CHECK(empty.value().value.empty());

    CHECK_FALSE(parseHeaderArg("no colon"));
    CHECK_FALSE(parseHeaderArg(": value"));
    CHECK_FALSE(parseHeaderArg("   : value"));
}
