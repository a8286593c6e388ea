#pragma once

#include <chrono>
#include <functional>
#include <istream>
#include <optional>
#include <string_view>
#include <vector>
#include <sluice/transfer/transfer.hpp>

namespace sluice::cli {

/**
 * Outcome of one request after the retry policy has run its course.
 */
struct RunOutcome {
    std::optional<transfer::TransferResult> result;
    std::optional<Error> error;
    int attempts{0};
    bool exhausted{false}; // retryable error still present after the last attempt

    bool ok() const { return result.has_value(); }
};

using Sleeper = std::function<void(std::chrono::milliseconds, const transfer::ShouldCancel&)>;

// Exit codes of the download command
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFatal = 1;
inline constexpr int kExitInvalid = 2;
inline constexpr int kExitRetriesExhausted = 3;

/**
 * Exponential backoff for the given 1-based attempt; jitter01 in [0,1] scales the delay
 * between half and all of the capped value.
 */
std::chrono::milliseconds backoffDelay(const transfer::RetryPolicy& policy, int attempt,
                                       double jitter01);

// Sleep in short slices, returning early on cancellation
void interruptibleSleep(std::chrono::milliseconds delay, const transfer::ShouldCancel& shouldCancel);

/**
 * Re-invoke runTransfer on retryable errors with backoff until success, a fatal error,
 * cancellation, or maxAttempts.
 */
RunOutcome runWithRetry(transfer::ITransferOrchestrator& orchestrator,
                        const transfer::TransferRequest& request,
                        const transfer::RetryPolicy& policy,
                        const transfer::ShouldCancel& shouldCancel = {},
                        const transfer::ProgressCallback& onProgress = {},
                        const Sleeper& sleep = interruptibleSleep);

/**
 * Run independent requests on a thread pool of `jobs` workers; outcomes are returned in
 * input order.
 */
std::vector<RunOutcome> runMany(transfer::ITransferOrchestrator& orchestrator,
                                const std::vector<transfer::TransferRequest>& requests,
                                const transfer::RetryPolicy& policy, int jobs,
                                const transfer::ShouldCancel& shouldCancel = {},
                                const Sleeper& sleep = interruptibleSleep);

int exitCodeFor(const RunOutcome& outcome);

// Worst exit code across outcomes (invalid > fatal > exhausted > success)
int exitCodeFor(const std::vector<RunOutcome>& outcomes);

/**
 * One JSON request per line; blank lines and lines starting with '#' are skipped.
 */
Result<std::vector<transfer::TransferRequest>> parseRequestList(std::istream& in);

// "Name: value" -> Header
Result<transfer::Header> parseHeaderArg(std::string_view arg);

} // namespace sluice::cli
