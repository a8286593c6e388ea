#include <sluice/crypto/hasher.h>
#include <sluice/transfer/transfer.hpp>

namespace sluice::transfer {

namespace {
constexpr std::string_view kKeyVersion = "v1";
} // namespace

Result<std::string> deriveIdempotencyKey(const ValidatedRequest& request,
                                         IdempotencyPolicy policy) {
    if (request.idempotencyKey) {
        return *request.idempotencyKey;
    }

    switch (policy) {
        case IdempotencyPolicy::Content: {
            std::string material;
            material.append(kKeyVersion).append("\n");
            material.append(request.sourceUrl).append("\n");
            material.append(request.destination.url());
            return crypto::SHA256Hasher::hash(std::string_view(material));
        }
        case IdempotencyPolicy::Invocation:
            if (!request.invocationId) {
                return Error{ErrorCode::InvalidRequest,
                             "Invocation idempotency requires an invocation id"};
            }
            return crypto::SHA256Hasher::hash(std::string_view(*request.invocationId));
    }
    return Error{ErrorCode::InternalError, "Unknown idempotency policy"};
}

} // namespace sluice::transfer
