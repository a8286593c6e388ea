// In-process fakes for transfer tests: scripted HTTP source and a crash-simulating state store

#pragma once

#include <sluice/transfer/transfer.hpp>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sluice::test {

/**
 * Source served from memory. Mirrors the classification of the HTTP reader:
 * unknown url -> SourceNotFound, offset > 0 without range support -> SourceRangeUnsupported.
 */
class FakeSourceReader : public transfer::ISourceReader {
public:
    struct Resource {
        std::vector<std::byte> data;
        transfer::SourceValidator validator;
        std::optional<std::string> contentType;
        std::optional<std::string> contentDisposition;
        bool supportsRange{true};
        bool declareLength{true};
        std::optional<std::uint64_t> declaredLength; // overrides data.size() when set
    };

    void setResource(const std::string& url, Resource resource) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_[url] = std::move(resource);
    }

    // Replace the bytes (and optionally the validator) served for url
    void mutate(const std::string& url, std::vector<std::byte> data,
                std::optional<transfer::SourceValidator> validator = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& r = resources_.at(url);
        r.data = std::move(data);
        if (validator) {
            r.validator = *validator;
        }
    }

    void setRangeSupport(const std::string& url, bool supported) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_.at(url).supportsRange = supported;
    }

    // Fail the next `times` open() calls with code
    void failOpens(ErrorCode code, int times = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        openFault_ = code;
        openFaultsRemaining_ = times;
    }

    // The next stream to reach absolute offset `at` fails with SourceUnreachable (one shot)
    void dropConnectionAt(std::uint64_t at) {
        std::lock_guard<std::mutex> lock(mutex_);
        dropAt_ = at;
    }

    // Serve at most n bytes per read() call
    void setReadGranularity(std::size_t n) { granularity_ = n; }

    std::uint64_t bytesServed() const { return served_.load(); }
    void resetCounters() {
        served_.store(0);
        std::lock_guard<std::mutex> lock(mutex_);
        openOffsets_.clear();
    }
    std::vector<std::uint64_t> openOffsets() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return openOffsets_;
    }

    Result<std::unique_ptr<transfer::ISourceStream>>
    open(std::string_view url, std::uint64_t offset,
         const transfer::SourceOptions& /*options*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        openOffsets_.push_back(offset);
        if (openFaultsRemaining_ > 0) {
            --openFaultsRemaining_;
            return Error{openFault_, "injected open fault"};
        }
        auto it = resources_.find(std::string(url));
        if (it == resources_.end()) {
            return Error{ErrorCode::SourceNotFound, "404 for " + std::string(url)};
        }
        const auto& r = it->second;
        if (offset > 0 && !r.supportsRange) {
            return Error{ErrorCode::SourceRangeUnsupported, "server ignored Range"};
        }
        if (offset > r.data.size()) {
            return Error{ErrorCode::StateCorruption, "offset beyond end of source"};
        }

        transfer::SourceInfo info;
        info.offset = offset;
        if (r.declaredLength) {
            info.totalBytes = r.declaredLength;
        } else if (r.declareLength) {
            info.totalBytes = r.data.size();
        }
        info.validator = r.validator;
        info.contentType = r.contentType;
        info.contentDisposition = r.contentDisposition;
        info.effectiveUrl = std::string(url);

        std::optional<std::uint64_t> drop;
        if (dropAt_ && *dropAt_ >= offset) {
            drop = dropAt_;
            dropAt_.reset();
        }
        return std::unique_ptr<transfer::ISourceStream>(
            new Stream(*this, std::move(info), r.data, offset, drop));
    }

private:
    class Stream : public transfer::ISourceStream {
    public:
        Stream(FakeSourceReader& owner, transfer::SourceInfo info, std::vector<std::byte> data,
               std::uint64_t pos, std::optional<std::uint64_t> dropAt)
            : owner_(owner), info_(std::move(info)), data_(std::move(data)), pos_(pos),
              dropAt_(dropAt) {}

        const transfer::SourceInfo& info() const override { return info_; }

        Result<std::size_t> read(std::span<std::byte> buffer,
                                 const transfer::ShouldCancel& shouldCancel) override {
            if (shouldCancel && shouldCancel()) {
                return Error{ErrorCode::OperationCancelled, "cancelled"};
            }
            if (dropAt_ && pos_ >= *dropAt_) {
                return Error{ErrorCode::SourceUnreachable, "connection reset by peer"};
            }
            std::uint64_t end = data_.size();
            if (dropAt_) {
                end = std::min<std::uint64_t>(end, *dropAt_);
            }
            std::size_t n = static_cast<std::size_t>(
                std::min<std::uint64_t>(buffer.size(), end - pos_));
            if (owner_.granularity_ > 0) {
                n = std::min(n, owner_.granularity_);
            }
            if (n > 0) {
                std::memcpy(buffer.data(), data_.data() + pos_, n);
            }
            pos_ += n;
            owner_.served_ += n;
            return n;
        }

    private:
        FakeSourceReader& owner_;
        transfer::SourceInfo info_;
        std::vector<std::byte> data_;
        std::uint64_t pos_;
        std::optional<std::uint64_t> dropAt_;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Resource> resources_;
    std::vector<std::uint64_t> openOffsets_;
    ErrorCode openFault_{ErrorCode::Success};
    int openFaultsRemaining_{0};
    std::optional<std::uint64_t> dropAt_;
    std::size_t granularity_{0};
    std::atomic<std::uint64_t> served_{0};
};

/**
 * Wraps a state store and fails every save after the first `allowedSaves`, simulating a
 * process that dies right after its last successful persist.
 */
class CrashingStateStore : public transfer::IStateStore {
public:
    explicit CrashingStateStore(std::shared_ptr<transfer::IStateStore> inner)
        : inner_(std::move(inner)) {}

    void crashAfterSaves(int allowedSaves) { remaining_ = allowedSaves; }
    void disarm() { remaining_ = -1; }
    int saves() const { return saves_; }
    // (attempt, bytesTransferred) of every successful save, in order
    std::vector<std::pair<std::uint32_t, std::uint64_t>> history() const { return history_; }

    Result<std::optional<transfer::TransferState>> load(std::string_view key) override {
        return inner_->load(key);
    }

    Result<void> save(std::string_view key, const transfer::TransferState& state) override {
        if (remaining_ == 0) {
            return Error{ErrorCode::StateUnavailable, "simulated crash"};
        }
        if (remaining_ > 0) {
            --remaining_;
        }
        ++saves_;
        history_.emplace_back(state.attempt, state.bytesTransferred);
        return inner_->save(key, state);
    }

    Result<void> remove(std::string_view key) override { return inner_->remove(key); }

    Result<Lease> acquire(std::string_view key, std::string_view owner) override {
        return inner_->acquire(key, owner);
    }

private:
    std::shared_ptr<transfer::IStateStore> inner_;
    int remaining_{-1};
    int saves_{0};
    std::vector<std::pair<std::uint32_t, std::uint64_t>> history_;
};

} // namespace sluice::test
