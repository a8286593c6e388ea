#include <sluice/cli/download_runner.h>
#include <sluice/transfer/json_codec.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <random>
#include <string>
#include <thread>

namespace sluice::cli {

using namespace sluice::transfer;

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(50);

double randomJitter() {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

int severity(int code) {
    switch (code) {
        case kExitInvalid: return 3;
        case kExitFatal: return 2;
        case kExitRetriesExhausted: return 1;
        default: return 0;
    }
}

} // namespace

std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int attempt, double jitter01) {
    const double base = static_cast<double>(policy.initialBackoff.count()) *
                        std::pow(policy.multiplier, std::max(0, attempt - 1));
    const double capped = std::min(base, static_cast<double>(policy.maxBackoff.count()));
    const double jitter = std::clamp(jitter01, 0.0, 1.0);
    return std::chrono::milliseconds(static_cast<long long>(capped * (0.5 + 0.5 * jitter)));
}

void interruptibleSleep(std::chrono::milliseconds delay, const ShouldCancel& shouldCancel) {
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (shouldCancel && shouldCancel()) {
            return;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(remaining, kSleepSlice));
    }
}

RunOutcome runWithRetry(ITransferOrchestrator& orchestrator, const TransferRequest& request,
                        const RetryPolicy& policy, const ShouldCancel& shouldCancel,
                        const ProgressCallback& onProgress, const Sleeper& sleep) {
    RunOutcome outcome;
    const int maxAttempts = std::max(1, policy.maxAttempts);

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        outcome.attempts = attempt;
        auto r = orchestrator.runTransfer(request, onProgress, shouldCancel);
        if (r) {
            outcome.result = std::move(r).value();
            outcome.error.reset();
            return outcome;
        }

        outcome.error = r.error();
        const auto code = r.error().code;
        if (!isRetryable(code) || code == ErrorCode::OperationCancelled) {
            return outcome;
        }
        if (attempt == maxAttempts) {
            outcome.exhausted = true;
            spdlog::error("{}: giving up after {} attempts: {}", request.url, attempt,
                          r.error().message);
            return outcome;
        }

        auto delay = backoffDelay(policy, attempt, randomJitter());
        spdlog::warn("{}: {} ({}); retrying in {} ms (attempt {}/{})", request.url,
                     r.error().message, errorCodeName(code), delay.count(), attempt + 1,
                     maxAttempts);
        sleep(delay, shouldCancel);
        if (shouldCancel && shouldCancel()) {
            outcome.error = Error{ErrorCode::OperationCancelled, "Cancelled while backing off"};
            return outcome;
        }
    }
    return outcome;
}

std::vector<RunOutcome> runMany(ITransferOrchestrator& orchestrator,
                                const std::vector<TransferRequest>& requests,
                                const RetryPolicy& policy, int jobs,
                                const ShouldCancel& shouldCancel, const Sleeper& sleep) {
    std::vector<RunOutcome> outcomes(requests.size());
    const auto workers = std::min(static_cast<std::size_t>(std::max(jobs, 1)),
                                  std::max<std::size_t>(requests.size(), 1));
    boost::asio::thread_pool pool(workers);
    for (std::size_t i = 0; i < requests.size(); ++i) {
        boost::asio::post(pool, [&, i]() {
            outcomes[i] = runWithRetry(orchestrator, requests[i], policy, shouldCancel, {}, sleep);
        });
    }
    pool.join();
    return outcomes;
}

int exitCodeFor(const RunOutcome& outcome) {
    if (outcome.ok()) {
        return kExitSuccess;
    }
    if (!outcome.error) {
        return kExitFatal;
    }
    const auto code = outcome.error->code;
    if (code == ErrorCode::InvalidRequest || code == ErrorCode::InvalidConfig) {
        return kExitInvalid;
    }
    if (outcome.exhausted || isRetryable(code)) {
        return kExitRetriesExhausted;
    }
    return kExitFatal;
}

int exitCodeFor(const std::vector<RunOutcome>& outcomes) {
    int worst = kExitSuccess;
    for (const auto& o : outcomes) {
        int code = exitCodeFor(o);
        if (severity(code) > severity(worst)) {
            worst = code;
        }
    }
    return worst;
}

Result<std::vector<TransferRequest>> parseRequestList(std::istream& in) {
    std::vector<TransferRequest> requests;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        auto req = requestFromJsonText(line);
        if (!req) {
            return Error{ErrorCode::InvalidRequest,
                         "line " + std::to_string(lineNo) + ": " + req.error().message};
        }
        requests.push_back(std::move(req).value());
    }
    return requests;
}

Result<Header> parseHeaderArg(std::string_view arg) {
    auto colon = arg.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return Error{ErrorCode::InvalidRequest,
                     "Header must look like 'Name: value': " + std::string(arg)};
    }
    auto name = arg.substr(0, colon);
    auto value = arg.substr(colon + 1);
    while (!name.empty() && (name.back() == ' ' || name.back() == '\t'))
        name.remove_suffix(1);
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
        value.remove_prefix(1);
    if (name.empty()) {
        return Error{ErrorCode::InvalidRequest, "Header name is empty: " + std::string(arg)};
    }
    return Header{std::string(name), std::string(value)};
}

} // namespace sluice::cli
