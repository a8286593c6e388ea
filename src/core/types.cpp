#include <sluice/core/types.h>

#include <array>

namespace sluice {

ErrorCode errorCodeFromName(std::string_view name) {
    static constexpr std::array kCodes = {
        ErrorCode::Success,
        ErrorCode::InvalidRequest,
        ErrorCode::SourceNotFound,
        ErrorCode::SourceUnreachable,
        ErrorCode::SourceRangeUnsupported,
        ErrorCode::SourceChanged,
        ErrorCode::DestinationDenied,
        ErrorCode::DestinationUnreachable,
        ErrorCode::DestinationUploadExpired,
        ErrorCode::StateCorruption,
        ErrorCode::StateUnavailable,
        ErrorCode::TransferInProgress,
        ErrorCode::OperationCancelled,
        ErrorCode::InvalidConfig,
        ErrorCode::InternalError,
    };
    for (auto code : kCodes) {
        if (name == errorCodeName(code)) {
            return code;
        }
    }
    return ErrorCode::InternalError;
}

} // namespace sluice
