/*
 * sluice/src/transfer/transfer_orchestrator.cpp
 *
 * TransferOrchestrator (single transfer, strictly sequential chunks):
 * - Derive the idempotency key, take the single-writer lease, load the recorded state
 * - Fresh transfer: open source at 0, resolve the object key, initiate the upload
 * - Resume: reopen the upload, check recorded parts against the backend, reopen the
 *   source at the recorded cursor (or re-read and verify from 0 when ranges are ignored)
 * - Loop: read one chunk, write part (index derived from committed bytes), persist
 * - End of stream: persist completing=true, complete, persist completed
 * - Retryable errors leave the state resumable; fatal errors abort the upload and mark
 *   the state failed. An expired upload restarts the destination once per invocation.
 */

#include <sluice/crypto/hasher.h>
#include <sluice/transfer/transfer.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sluice::transfer {

namespace {

constexpr int kMaxUploadRestartsPerRun = 1;

std::optional<float> percentOf(std::uint64_t done, const std::optional<std::uint64_t>& total) {
    if (!total || *total == 0) {
        return std::nullopt;
    }
    return static_cast<float>((static_cast<long double>(done) * 100.0L) /
                              static_cast<long double>(*total));
}

// Fill buffer from stream until full or end of stream
Result<std::size_t> readChunk(ISourceStream& stream, std::span<std::byte> buffer,
                              const ShouldCancel& shouldCancel) {
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        auto n = stream.read(buffer.subspan(filled), shouldCancel);
        if (!n) {
            return n.error();
        }
        if (n.value() == 0) {
            break;
        }
        filled += n.value();
    }
    return filled;
}

} // namespace

class TransferOrchestrator final : public ITransferOrchestrator {
public:
    TransferOrchestrator(TransferConfig cfg, std::shared_ptr<IStateStore> stateStore,
                         std::shared_ptr<ISourceReader> sourceReader)
        : cfg_(std::move(cfg)), store_(std::move(stateStore)), reader_(std::move(sourceReader)) {}

    Result<TransferResult> runTransfer(const TransferRequest& request,
                                       const ProgressCallback& onProgress,
                                       const ShouldCancel& shouldCancel) override {
        auto validated = validateRequest(request);
        if (!validated) {
            return validated.error();
        }
        const auto& req = validated.value();

        auto key = deriveIdempotencyKey(req, cfg_.idempotency);
        if (!key) {
            return key.error();
        }

        auto writer = storage::DestinationWriterFactory::create(req.destination, cfg_.destination);
        if (!writer) {
            return writer.error();
        }

        auto lease = store_->acquire(key.value(), cfg_.owner);
        if (!lease) {
            return lease.error();
        }

        auto loaded = store_->load(key.value());
        if (!loaded) {
            return loaded.error();
        }

        Session s{req, key.value(), std::move(writer).value(), onProgress, shouldCancel};
        s.sourceOptions = cfg_.source;
        s.sourceOptions.headers.insert(s.sourceOptions.headers.end(), req.headers.begin(),
                                       req.headers.end());
        if (req.timeout) {
            s.sourceOptions.timeout = *req.timeout;
        }

        if (auto& prior = loaded.value()) {
            if (prior->source != req.sourceUrl || prior->destination != req.destination.url()) {
                return Error{ErrorCode::InvalidRequest,
                             "Idempotency key " + key.value() +
                                 " is bound to a different transfer (" + prior->source + " -> " +
                                 prior->destination + ")"};
            }
            switch (prior->status) {
                case TransferStatus::Completed:
                    spdlog::info("Transfer {} already completed: {} ({} bytes)", key.value(),
                                 prior->location.value_or(""), prior->bytesTransferred);
                    return TransferResult{key.value(), prior->bytesTransferred,
                                          prior->location.value_or(""), prior->attempt, true};
                case TransferStatus::Failed:
                    if (!req.restart) {
                        auto err = prior->error.value_or(
                            Error{ErrorCode::InternalError, "Transfer previously failed"});
                        spdlog::info("Transfer {} previously failed ({}); restart not requested",
                                     key.value(), errorCodeName(err.code));
                        return err;
                    }
                    s.state = std::move(*prior);
                    if (auto r = restartFailed(s); !r) {
                        return r.error();
                    }
                    break;
                case TransferStatus::InProgress:
                    s.state = std::move(*prior);
                    s.resumed = true;
                    spdlog::info("Resuming transfer {} at {} bytes (attempt {})", key.value(),
                                 s.state.bytesTransferred, s.state.attempt);
                    break;
            }
        } else {
            auto chunk = checkedChunkSize(*s.writer);
            if (!chunk) {
                return chunk.error();
            }
            s.state.key = key.value();
            s.state.source = req.sourceUrl;
            s.state.destination = req.destination.url();
            s.state.chunkSize = chunk.value();
            if (!req.destination.isPrefix()) {
                s.state.resolvedKey = req.destination.key;
            }
            spdlog::info("Starting transfer {}: {} -> {}", key.value(), req.sourceUrl,
                         s.state.destination);
        }

        emit(s, ProgressStage::Connecting);

        for (int restarts = 0;; ++restarts) {
            auto result = execute(s);
            if (result) {
                return result;
            }
            auto err = result.error();

            if (err.code == ErrorCode::DestinationUploadExpired) {
                if (s.state.completing) {
                    auto adopted = adoptCommittedObject(s);
                    if (!adopted) {
                        return fail(s, adopted.error());
                    }
                    if (adopted.value()) {
                        return std::move(adopted.value()).value();
                    }
                }
                if (restarts < kMaxUploadRestartsPerRun) {
                    spdlog::warn("Transfer {}: upload expired ({}); restarting destination",
                                 s.key, err.message);
                    s.state.resumeToken.reset();
                    if (auto r = beginNewAttempt(s); !r) {
                        return r.error();
                    }
                    continue;
                }
            }

            if (isRetryable(err.code)) {
                spdlog::warn("Transfer {} interrupted at {} bytes: {} ({})", s.key,
                             s.state.bytesTransferred, err.message, errorCodeName(err.code));
                return err;
            }
            return fail(s, std::move(err));
        }
    }

    Result<std::optional<TransferState>> inspect(const TransferRequest& request) override {
        auto validated = validateRequest(request);
        if (!validated) {
            return validated.error();
        }
        auto key = deriveIdempotencyKey(validated.value(), cfg_.idempotency);
        if (!key) {
            return key.error();
        }
        return store_->load(key.value());
    }

    [[nodiscard]] TransferConfig config() const override { return cfg_; }

private:
    struct Session {
        const ValidatedRequest& req;
        std::string key;
        std::unique_ptr<storage::IDestinationWriter> writer;
        const ProgressCallback& onProgress;
        const ShouldCancel& shouldCancel;
        SourceOptions sourceOptions{};
        TransferState state{};
        bool resumed{false};
    };

    Result<std::size_t> checkedChunkSize(const storage::IDestinationWriter& writer) const {
        if (cfg_.chunkSize == 0 || cfg_.chunkSize > MAX_CHUNK_SIZE) {
            return Error{ErrorCode::InvalidConfig,
                         "chunk size must be between 1 byte and 5 GiB, got " +
                             std::to_string(cfg_.chunkSize)};
        }
        if (cfg_.chunkSize < writer.minPartSize()) {
            return Error{ErrorCode::InvalidConfig,
                         "chunk size " + std::to_string(cfg_.chunkSize) + " is below the " +
                             writer.getType() + " minimum part size " +
                             std::to_string(writer.minPartSize())};
        }
        return cfg_.chunkSize;
    }

    void emit(const Session& s, ProgressStage stage) const {
        if (!s.onProgress) {
            return;
        }
        ProgressEvent ev;
        ev.url = s.req.sourceUrl;
        ev.bytesTransferred = s.state.bytesTransferred;
        ev.totalBytes = s.state.totalBytes;
        ev.percentage = percentOf(s.state.bytesTransferred, s.state.totalBytes);
        ev.stage = stage;
        s.onProgress(ev);
    }

    Result<void> persist(Session& s) {
        if (auto r = store_->save(s.key, s.state); !r) {
            auto err = r.error();
            if (err.code != ErrorCode::StateUnavailable) {
                err = Error{ErrorCode::StateUnavailable, err.message};
            }
            return err;
        }
        return {};
    }

    // Drop all destination progress and start the next attempt from byte 0
    Result<void> beginNewAttempt(Session& s) {
        s.state.attempt += 1;
        s.state.bytesTransferred = 0;
        s.state.sourceCursor = 0;
        s.state.totalBytes.reset();
        s.state.validator = SourceValidator{};
        s.state.completing = false;
        s.state.resumeToken.reset();
        s.state.error.reset();
        s.state.status = TransferStatus::InProgress;
        return persist(s);
    }

    Result<void> restartFailed(Session& s) {
        spdlog::info("Restarting failed transfer {} (previous error: {})", s.key,
                     s.state.error ? errorCodeName(s.state.error->code) : "unknown");
        if (s.state.resumeToken) {
            abortUpload(s);
        }
        auto chunk = checkedChunkSize(*s.writer);
        if (!chunk) {
            return chunk.error();
        }
        s.state.chunkSize = chunk.value();
        s.state.location.reset();
        return beginNewAttempt(s);
    }

    // Best-effort abort; the token is kept if the backend could not confirm
    void abortUpload(Session& s) {
        if (!s.state.resumeToken) {
            return;
        }
        auto r = s.writer->abort(s.state.resolvedKey, s.state.resumeToken->uploadId);
        if (r) {
            spdlog::debug("Aborted upload {} for {}", s.state.resumeToken->uploadId, s.key);
            s.state.resumeToken.reset();
        } else {
            spdlog::warn("Failed to abort upload {} for {}: {}", s.state.resumeToken->uploadId,
                         s.key, r.error().message);
        }
    }

    Result<TransferResult> fail(Session& s, Error err) {
        abortUpload(s);
        s.state.status = TransferStatus::Failed;
        s.state.completing = false;
        s.state.error = err;
        if (auto r = persist(s); !r) {
            spdlog::error("Transfer {}: could not record failure: {}", s.key, r.error().message);
        }
        spdlog::error("Transfer {} failed: {} ({})", s.key, err.message, errorCodeName(err.code));
        return err;
    }

    Result<TransferResult> markCompleted(Session& s, std::string location) {
        s.state.status = TransferStatus::Completed;
        s.state.resumeToken.reset();
        s.state.completing = false;
        s.state.error.reset();
        s.state.location = location;
        if (auto r = persist(s); !r) {
            return r.error();
        }
        spdlog::info("Transfer {} completed: {} ({} bytes, attempt {})", s.key, location,
                     s.state.bytesTransferred, s.state.attempt);
        return TransferResult{s.key, s.state.bytesTransferred, std::move(location),
                              s.state.attempt, s.resumed};
    }

    // Upload gone while completing: accept the object if it is already committed
    Result<std::optional<TransferResult>> adoptCommittedObject(Session& s) {
        auto size = s.writer->stat(s.state.resolvedKey);
        if (!size) {
            return size.error();
        }
        if (size.value() && *size.value() == s.state.bytesTransferred) {
            spdlog::info("Transfer {}: object already committed by a previous invocation", s.key);
            s.state.resumeToken.reset();
            auto done = markCompleted(
                s, s.req.destination.urlForKey(s.state.resolvedKey));
            if (!done) {
                return done.error();
            }
            return std::optional<TransferResult>{std::move(done).value()};
        }
        return std::optional<TransferResult>{};
    }

    // Reopened backend parts must cover every recorded part with the same size
    Result<void> verifyResumeToken(const Session& s,
                                   const std::vector<storage::PartInfo>& backendParts) const {
        const auto& recorded = s.state.resumeToken->parts;
        std::uint64_t sum = 0;
        for (std::size_t i = 0; i < recorded.size(); ++i) {
            const auto& part = recorded[i];
            if (part.index != i + 1) {
                return Error{ErrorCode::StateCorruption,
                             "Recorded parts are not contiguous at index " +
                                 std::to_string(part.index)};
            }
            if (part.size > s.state.chunkSize) {
                return Error{ErrorCode::StateCorruption,
                             "Recorded part " + std::to_string(part.index) +
                                 " is larger than the chunk size"};
            }
            auto it = std::find_if(backendParts.begin(), backendParts.end(),
                                   [&](const storage::PartInfo& p) { return p.index == part.index; });
            if (it == backendParts.end() || it->size != part.size) {
                return Error{ErrorCode::StateCorruption,
                             "Destination does not hold recorded part " +
                                 std::to_string(part.index) + " of " + std::to_string(part.size) +
                                 " bytes"};
            }
            sum += part.size;
        }
        if (sum != s.state.bytesTransferred) {
            return Error{ErrorCode::StateCorruption,
                         "Recorded parts hold " + std::to_string(sum) + " bytes but state claims " +
                             std::to_string(s.state.bytesTransferred)};
        }
        return {};
    }

    // Same content as the original attempt, or SourceChanged
    Result<void> checkSourceIdentity(const Session& s, const SourceInfo& info) const {
        const auto& recorded = s.state.validator;
        if (recorded.etag && info.validator.etag && *recorded.etag != *info.validator.etag) {
            return Error{ErrorCode::SourceChanged, "Source ETag changed from " + *recorded.etag +
                                                       " to " + *info.validator.etag};
        }
        if (!(recorded.etag && info.validator.etag) && recorded.lastModified &&
            info.validator.lastModified && *recorded.lastModified != *info.validator.lastModified) {
            return Error{ErrorCode::SourceChanged,
                         "Source Last-Modified changed from " + *recorded.lastModified + " to " +
                             *info.validator.lastModified};
        }
        if (s.state.totalBytes && info.totalBytes && *s.state.totalBytes != *info.totalBytes) {
            return Error{ErrorCode::SourceChanged,
                         "Source length changed from " + std::to_string(*s.state.totalBytes) +
                             " to " + std::to_string(*info.totalBytes)};
        }
        if (info.totalBytes && s.state.bytesTransferred > *info.totalBytes) {
            return Error{ErrorCode::StateCorruption,
                         "Committed " + std::to_string(s.state.bytesTransferred) +
                             " bytes exceed source length " + std::to_string(*info.totalBytes)};
        }
        return {};
    }

    // Re-read committed parts from a source that restarted at 0 and verify each one
    Result<void> skipCommittedParts(Session& s, ISourceStream& stream) {
        std::vector<std::byte> buffer(s.state.chunkSize);
        for (const auto& part : s.state.resumeToken->parts) {
            auto view = std::span<std::byte>(buffer.data(), static_cast<std::size_t>(part.size));
            auto n = readChunk(stream, view, s.shouldCancel);
            if (!n) {
                return n.error();
            }
            if (n.value() != part.size ||
                crypto::SHA256Hasher::hash(std::span<const std::byte>(view)) != part.sha256) {
                return Error{ErrorCode::SourceChanged,
                             "Source content differs from committed part " +
                                 std::to_string(part.index)};
            }
        }
        spdlog::debug("Transfer {}: verified {} committed bytes from a full source re-read",
                      s.key, s.state.bytesTransferred);
        return {};
    }

    Result<std::unique_ptr<ISourceStream>> openSourceForResume(Session& s) {
        auto stream = reader_->open(s.req.sourceUrl, s.state.sourceCursor, s.sourceOptions);
        if (stream || stream.error().code != ErrorCode::SourceRangeUnsupported) {
            if (stream) {
                if (auto r = checkSourceIdentity(s, stream.value()->info()); !r) {
                    return r.error();
                }
            }
            return stream;
        }

        if (cfg_.rangeFallback == RangeFallback::RestartAll) {
            spdlog::info("Transfer {}: source ignores ranges; restarting from zero", s.key);
            abortUpload(s);
            if (s.state.resumeToken) {
                return Error{ErrorCode::DestinationUnreachable,
                             "Could not abort upload before restarting transfer " + s.key};
            }
            if (auto r = beginNewAttempt(s); !r) {
                return r.error();
            }
            return openFresh(s);
        }

        spdlog::info("Transfer {}: source ignores ranges; re-reading {} committed bytes", s.key,
                     s.state.bytesTransferred);
        auto full = reader_->open(s.req.sourceUrl, 0, s.sourceOptions);
        if (!full) {
            return full.error();
        }
        if (auto r = checkSourceIdentity(s, full.value()->info()); !r) {
            return r.error();
        }
        if (auto r = skipCommittedParts(s, *full.value()); !r) {
            return r.error();
        }
        return full;
    }

    // First attempt (or a restarted one): open at 0, resolve key, initiate the upload
    Result<std::unique_ptr<ISourceStream>> openFresh(Session& s) {
        auto stream = reader_->open(s.req.sourceUrl, 0, s.sourceOptions);
        if (!stream) {
            return stream.error();
        }
        const auto& info = stream.value()->info();
        s.state.totalBytes = info.totalBytes;
        s.state.validator = info.validator;
        if (s.req.setContentType) {
            s.state.contentType = s.req.contentType ? s.req.contentType : info.contentType;
        }
        if (s.state.resolvedKey.empty()) {
            s.state.resolvedKey =
                resolveObjectKey(s.req.destination.key, info, s.req.sourceUrl);
            spdlog::debug("Transfer {}: resolved object key '{}'", s.key, s.state.resolvedKey);
        }

        storage::UploadOptions options;
        options.contentType = s.state.contentType;
        auto uploadId = s.writer->initiate(s.state.resolvedKey, options);
        if (!uploadId) {
            return uploadId.error();
        }
        s.state.resumeToken = ResumeToken{uploadId.value(), {}};
        if (auto r = persist(s); !r) {
            return r.error();
        }
        spdlog::debug("Transfer {}: upload {} initiated for {}", s.key, uploadId.value(),
                      s.req.destination.urlForKey(s.state.resolvedKey));
        return stream;
    }

    Result<void> commitChunk(Session& s, std::span<const std::byte> data) {
        const auto index = static_cast<std::uint32_t>(s.state.bytesTransferred / s.state.chunkSize + 1);
        if (s.writer->getType() == "s3" && index > S3_MAX_PARTS) {
            return Error{ErrorCode::InvalidConfig,
                         "Object needs more than " + std::to_string(S3_MAX_PARTS) +
                             " parts at chunk size " + std::to_string(s.state.chunkSize)};
        }

        auto& token = *s.state.resumeToken;
        auto part = s.writer->writePart(s.state.resolvedKey, token.uploadId, index, data);
        if (!part) {
            return part.error();
        }
        auto info = std::move(part).value();
        info.index = index;
        info.size = data.size();
        info.sha256 = crypto::SHA256Hasher::hash(data);

        // Parts beyond the committed prefix are stale leftovers of an interrupted run
        token.parts.erase(std::remove_if(token.parts.begin(), token.parts.end(),
                                         [&](const storage::PartInfo& p) { return p.index >= index; }),
                          token.parts.end());
        token.parts.push_back(std::move(info));

        s.state.bytesTransferred += data.size();
        s.state.sourceCursor = s.state.bytesTransferred;
        if (auto r = persist(s); !r) {
            return r;
        }
        spdlog::debug("Transfer {}: committed part {} ({} bytes, total {})", s.key, index,
                      data.size(), s.state.bytesTransferred);
        emit(s, ProgressStage::Transferring);
        return {};
    }

    Result<TransferResult> finish(Session& s) {
        if (!s.state.completing) {
            s.state.completing = true;
            if (auto r = persist(s); !r) {
                return r.error();
            }
        }
        emit(s, ProgressStage::Completing);

        auto& token = *s.state.resumeToken;
        auto location = s.writer->complete(s.state.resolvedKey, token.uploadId, token.parts);
        if (!location) {
            return location.error();
        }
        return markCompleted(s, std::move(location).value());
    }

    Result<TransferResult> execute(Session& s) {
        std::unique_ptr<ISourceStream> stream;

        if (s.state.resumeToken) {
            auto backendParts =
                s.writer->reopen(s.state.resolvedKey, s.state.resumeToken->uploadId);
            if (!backendParts) {
                return backendParts.error();
            }
            if (auto r = verifyResumeToken(s, backendParts.value()); !r) {
                return r.error();
            }
            if (s.state.completing) {
                return finish(s);
            }
            auto opened = openSourceForResume(s);
            if (!opened) {
                return opened.error();
            }
            stream = std::move(opened).value();
        } else {
            auto opened = openFresh(s);
            if (!opened) {
                return opened.error();
            }
            stream = std::move(opened).value();
        }

        std::vector<std::byte> buffer(s.state.chunkSize);
        for (;;) {
            if (s.shouldCancel && s.shouldCancel()) {
                return Error{ErrorCode::OperationCancelled,
                             "Transfer cancelled at " + std::to_string(s.state.bytesTransferred) +
                                 " bytes"};
            }
            auto n = readChunk(*stream, buffer, s.shouldCancel);
            if (!n) {
                return n.error();
            }
            if (n.value() == 0) {
                break;
            }
            if (s.state.totalBytes && s.state.bytesTransferred + n.value() > *s.state.totalBytes) {
                return Error{ErrorCode::SourceChanged,
                             "Source delivered more than its declared " +
                                 std::to_string(*s.state.totalBytes) + " bytes"};
            }
            if (auto r = commitChunk(s, std::span<const std::byte>(buffer.data(), n.value()));
                !r) {
                return r.error();
            }
        }

        if (s.state.totalBytes && s.state.bytesTransferred != *s.state.totalBytes) {
            return Error{ErrorCode::SourceUnreachable,
                         "Source ended after " + std::to_string(s.state.bytesTransferred) +
                             " of " + std::to_string(*s.state.totalBytes) + " bytes"};
        }
        if (s.state.resumeToken->parts.empty()) {
            // Zero-length source: one empty part so every backend can complete
            if (auto r = commitChunk(s, {}); !r) {
                return r.error();
            }
        }
        return finish(s);
    }

    TransferConfig cfg_;
    std::shared_ptr<IStateStore> store_;
    std::shared_ptr<ISourceReader> reader_;
};

std::unique_ptr<ITransferOrchestrator>
makeTransferOrchestrator(TransferConfig cfg, std::shared_ptr<IStateStore> stateStore,
                         std::shared_ptr<ISourceReader> sourceReader) {
    return std::make_unique<TransferOrchestrator>(std::move(cfg), std::move(stateStore),
                                                  std::move(sourceReader));
}

} // namespace sluice::transfer
