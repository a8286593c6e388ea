#pragma once

/*
 * sluice transfer pipeline - public types and interfaces (C++20)
 *
 * A transfer streams one HTTP(S) source into one destination object through a
 * multipart upload, persisting progress after every acknowledged part so that a
 * re-invocation resumes instead of restarting.
 *
 * Components:
 * - ISourceReader / ISourceStream: ranged, restartable byte source
 * - storage::IDestinationWriter: multipart upload primitives
 * - IStateStore: durable TransferState slot per idempotency key, single-writer leases
 * - ITransferOrchestrator: the chunked read/write/persist state machine
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <sluice/core/types.h>
#include <sluice/storage/destination_writer.h>

namespace sluice::transfer {

// ================================
// Fundamental enums and constants
// ================================

enum class TransferStatus { InProgress, Completed, Failed };

constexpr const char* statusName(TransferStatus status) {
    switch (status) {
        case TransferStatus::InProgress: return "in_progress";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed: return "failed";
    }
    return "in_progress";
}

std::optional<TransferStatus> parseStatus(std::string_view name);

/**
 * How the idempotency key identifying "the same logical request" is derived.
 * Content: hash of source + destination (identical requests coalesce).
 * Invocation: hash of the caller-supplied invocation identity.
 */
enum class IdempotencyPolicy { Content, Invocation };

/**
 * Resume strategy when the source ignores range requests.
 * KeepParts: re-read from zero, verify and skip committed parts.
 * RestartAll: abort the upload and start a fresh attempt.
 */
enum class RangeFallback { KeepParts, RestartAll };

enum class ProgressStage { Connecting, Transferring, Completing };

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Retry/backoff policy applied by the caller around runTransfer().
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Per-request source options (timeouts of 0 mean "none").
 */
struct SourceOptions {
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds connectTimeout{30000};
    long lowSpeedLimitBps{1};
    std::chrono::seconds lowSpeedTime{60};
    std::string userAgent{"sluice/1.0"};
    long maxRedirects{10};
    TlsConfig tls{};
};

struct OutputSpec {
    std::string url;
    bool setContentType{false};
    std::optional<std::string> contentType;
};

/**
 * Inbound download request. Immutable once validated.
 */
struct TransferRequest {
    std::string url;
    std::vector<Header> headers;
    std::optional<std::chrono::milliseconds> timeout;
    OutputSpec output;

    std::optional<std::string> idempotencyKey;
    std::optional<std::string> invocationId;
    bool restart{false}; // explicitly restart a transfer recorded as failed
};

/**
 * Structured form of a TransferRequest produced by the validator.
 */
struct ValidatedRequest {
    std::string sourceUrl;
    storage::DestinationLocation destination;
    std::vector<Header> headers;
    std::optional<std::chrono::milliseconds> timeout;
    bool setContentType{false};
    std::optional<std::string> contentType;
    std::optional<std::string> idempotencyKey;
    std::optional<std::string> invocationId;
    bool restart{false};
};

/**
 * Strong content validator reported by the source.
 */
struct SourceValidator {
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;

    bool empty() const { return !etag && !lastModified; }
};

/**
 * Destination resume handle: upload id plus committed parts ordered by index.
 */
struct ResumeToken {
    std::string uploadId;
    std::vector<storage::PartInfo> parts;
};

/**
 * Durable progress record of one transfer. Serialized by the state store.
 */
struct TransferState {
    static constexpr int kVersion = 1;

    std::string key;
    std::uint32_t attempt{1};
    TransferStatus status{TransferStatus::InProgress};

    std::string source;
    std::string destination;
    std::string resolvedKey; // object key after prefix resolution
    std::size_t chunkSize{DEFAULT_CHUNK_SIZE};

    std::uint64_t bytesTransferred{0};
    std::uint64_t sourceCursor{0};
    std::optional<std::uint64_t> totalBytes;
    SourceValidator validator;
    std::optional<std::string> contentType;

    std::optional<ResumeToken> resumeToken;
    bool completing{false};

    std::optional<Error> error;
    std::optional<std::string> location;
};

/**
 * Outcome of a successful runTransfer().
 */
struct TransferResult {
    std::string key;
    std::uint64_t bytesTransferred{0};
    std::string location;
    std::uint32_t attempt{1};
    bool resumed{false};
};

/**
 * Streaming progress event for a single transfer.
 */
struct ProgressEvent {
    std::string url;
    std::uint64_t bytesTransferred{0};
    std::optional<std::uint64_t> totalBytes{};
    std::optional<float> percentage{}; // 0.0 - 100.0 (approx)
    ProgressStage stage{ProgressStage::Transferring};
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldCancel = std::function<bool()>; // return true to cancel ASAP

// ==========================
// Service interface classes
// ==========================

/**
 * Response metadata of an opened source.
 */
struct SourceInfo {
    std::uint64_t offset{0};                // first byte this stream delivers
    std::optional<std::uint64_t> totalBytes; // full resource length when declared
    SourceValidator validator;
    std::optional<std::string> contentType;
    std::optional<std::string> contentDisposition;
    std::string effectiveUrl;               // after redirects
};

/**
 * Lazy, finite byte sequence. Not restartable: reopen with a new offset instead.
 */
class ISourceStream {
public:
    virtual ~ISourceStream() = default;

    virtual const SourceInfo& info() const = 0;

    /**
     * Fill up to buffer.size() bytes; returns 0 at end of stream.
     */
    virtual Result<std::size_t> read(std::span<std::byte> buffer,
                                     const ShouldCancel& shouldCancel) = 0;
};

/**
 * Source reader. open() fails with SourceUnreachable (retryable), SourceNotFound
 * (fatal) or SourceRangeUnsupported (offset > 0 but the server ignored the range).
 */
class ISourceReader {
public:
    virtual ~ISourceReader() = default;

    virtual Result<std::unique_ptr<ISourceStream>>
    open(std::string_view url, std::uint64_t offset, const SourceOptions& options) = 0;
};

/**
 * Durable TransferState slot per idempotency key.
 */
class IStateStore {
public:
    /**
     * Exclusive write access to one key; released on destruction.
     */
    class Lease {
    public:
        Lease() = default;
        Lease(std::string key, std::function<void()> release)
            : key_(std::move(key)), release_(std::move(release)) {}
        ~Lease() { reset(); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept
            : key_(std::move(other.key_)), release_(std::exchange(other.release_, nullptr)) {}
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                reset();
                key_ = std::move(other.key_);
                release_ = std::exchange(other.release_, nullptr);
            }
            return *this;
        }

        const std::string& key() const { return key_; }
        bool held() const { return static_cast<bool>(release_); }

        void reset() {
            if (release_) {
                auto release = std::exchange(release_, nullptr);
                release();
            }
        }

    private:
        std::string key_;
        std::function<void()> release_;
    };

    virtual ~IStateStore() = default;

    virtual Result<std::optional<TransferState>> load(std::string_view key) = 0;
    virtual Result<void> save(std::string_view key, const TransferState& state) = 0;
    virtual Result<void> remove(std::string_view key) = 0;

    /**
     * Take the single-writer lease for key. Fails with TransferInProgress when held.
     */
    virtual Result<Lease> acquire(std::string_view key, std::string_view owner) = 0;
};

/**
 * Orchestrator configuration.
 */
struct TransferConfig {
    std::size_t chunkSize{DEFAULT_CHUNK_SIZE};
    IdempotencyPolicy idempotency{IdempotencyPolicy::Content};
    RangeFallback rangeFallback{RangeFallback::KeepParts};
    SourceOptions source{};
    storage::DestinationConfig destination{};
    std::string owner{"sluice"}; // lease owner label
};

/**
 * Drives one transfer to completion or to a definitive failure.
 */
class ITransferOrchestrator {
public:
    virtual ~ITransferOrchestrator() = default;

    /**
     * Run (or resume) the transfer described by request. Retryable errors leave the
     * persisted state resumable; fatal errors mark it failed.
     */
    virtual Result<TransferResult> runTransfer(const TransferRequest& request,
                                               const ProgressCallback& onProgress = {},
                                               const ShouldCancel& shouldCancel = {}) = 0;

    /**
     * Recorded state for request, without running anything.
     */
    virtual Result<std::optional<TransferState>> inspect(const TransferRequest& request) = 0;

    [[nodiscard]] virtual TransferConfig config() const = 0;
};

// ===================
// Request validation
// ===================

/**
 * Parse and check the request before any I/O: http(s) source with a host,
 * supported destination scheme with container and key or prefix.
 */
Result<ValidatedRequest> validateRequest(const TransferRequest& request);

/**
 * Parse "10m", "1h 30m", "45s", "250ms", "2h", or a bare number of seconds.
 */
Result<std::chrono::milliseconds> parseHumanDuration(std::string_view text);

/**
 * File name carried by a Content-Disposition header (filename* preferred).
 */
std::optional<std::string> filenameFromContentDisposition(std::string_view header);

/**
 * Object key for a prefix destination: Content-Disposition name, else the last URL
 * path segment, else "download".
 */
std::string resolveObjectKey(std::string_view prefix, const SourceInfo& info,
                             std::string_view sourceUrl);

/**
 * Key of the durable state slot for request under policy.
 */
Result<std::string> deriveIdempotencyKey(const ValidatedRequest& request,
                                         IdempotencyPolicy policy);

// ==========
// Factories
// ==========

std::unique_ptr<ISourceReader> makeHttpSourceReader();

std::shared_ptr<IStateStore> makeInMemoryStateStore();
Result<std::shared_ptr<IStateStore>> makeFileStateStore(const std::filesystem::path& dir);

std::unique_ptr<ITransferOrchestrator>
makeTransferOrchestrator(TransferConfig cfg, std::shared_ptr<IStateStore> stateStore,
                         std::shared_ptr<ISourceReader> sourceReader);

} // namespace sluice::transfer
