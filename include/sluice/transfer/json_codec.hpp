#pragma once

#include <nlohmann/json.hpp>
#include <sluice/transfer/transfer.hpp>

namespace sluice::transfer {

// TransferState <-> JSON (the persisted form, see FileStateStore)
nlohmann::json stateToJson(const TransferState& state);
Result<TransferState> stateFromJson(const nlohmann::json& j);

/**
 * Request body of the download operation:
 * {"url", "request": {"headers": {..}, "timeout": "10m"},
 *  "output": {"url", "setContentType", "contentType"}, "idempotencyKey", "restart"}
 */
Result<TransferRequest> requestFromJson(const nlohmann::json& j);
Result<TransferRequest> requestFromJsonText(std::string_view text);
nlohmann::json requestToJson(const TransferRequest& request);

// {"size", "location", "status": "completed"}
nlohmann::json resultToJson(const TransferResult& result);
// {"error": {"kind", "message"}}
nlohmann::json errorToJson(const Error& error);

} // namespace sluice::transfer
