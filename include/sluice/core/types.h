#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sluice {

// Type aliases
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidRequest,
    SourceNotFound,
    SourceUnreachable,
    SourceRangeUnsupported,
    SourceChanged,
    DestinationDenied,
    DestinationUnreachable,
    DestinationUploadExpired,
    StateCorruption,
    StateUnavailable,
    TransferInProgress,
    OperationCancelled,
    InvalidConfig,
    InternalError
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidRequest: return "Invalid request";
        case ErrorCode::SourceNotFound: return "Source not found";
        case ErrorCode::SourceUnreachable: return "Source unreachable";
        case ErrorCode::SourceRangeUnsupported: return "Source does not support range requests";
        case ErrorCode::SourceChanged: return "Source content changed";
        case ErrorCode::DestinationDenied: return "Destination access denied";
        case ErrorCode::DestinationUnreachable: return "Destination unreachable";
        case ErrorCode::DestinationUploadExpired: return "Destination upload expired";
        case ErrorCode::StateCorruption: return "Transfer state corruption";
        case ErrorCode::StateUnavailable: return "Transfer state unavailable";
        case ErrorCode::TransferInProgress: return "Transfer already in progress";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InvalidConfig: return "Invalid configuration";
        case ErrorCode::InternalError: return "Internal error";
    }
    return "Internal error";
}

// Stable machine-readable identifier (used in JSON responses and persisted state)
constexpr const char* errorCodeName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "success";
        case ErrorCode::InvalidRequest: return "invalid_request";
        case ErrorCode::SourceNotFound: return "source_not_found";
        case ErrorCode::SourceUnreachable: return "source_unreachable";
        case ErrorCode::SourceRangeUnsupported: return "source_range_unsupported";
        case ErrorCode::SourceChanged: return "source_changed";
        case ErrorCode::DestinationDenied: return "destination_denied";
        case ErrorCode::DestinationUnreachable: return "destination_unreachable";
        case ErrorCode::DestinationUploadExpired: return "destination_upload_expired";
        case ErrorCode::StateCorruption: return "state_corruption";
        case ErrorCode::StateUnavailable: return "state_unavailable";
        case ErrorCode::TransferInProgress: return "transfer_in_progress";
        case ErrorCode::OperationCancelled: return "operation_cancelled";
        case ErrorCode::InvalidConfig: return "invalid_config";
        case ErrorCode::InternalError: return "internal_error";
    }
    return "internal_error";
}

// Inverse of errorCodeName; unknown names map to InternalError
ErrorCode errorCodeFromName(std::string_view name);

// Retryable errors leave the transfer resumable; the caller's retry policy re-invokes it.
constexpr bool isRetryable(ErrorCode error) {
    switch (error) {
        case ErrorCode::SourceUnreachable:
        case ErrorCode::DestinationUnreachable:
        case ErrorCode::StateUnavailable:
        case ErrorCode::TransferInProgress:
        case ErrorCode::OperationCancelled:
            return true;
        default:
            return false;
    }
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

// Transfer sizing constants
inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 8ull * 1024ull * 1024ull;  // 8 MiB
inline constexpr std::size_t S3_MIN_PART_SIZE = 5ull * 1024ull * 1024ull;    // 5 MiB
inline constexpr std::size_t MAX_CHUNK_SIZE = 5ull * 1024ull * 1024ull * 1024ull; // 5 GiB
inline constexpr std::uint32_t S3_MAX_PARTS = 10000;

} // namespace sluice
