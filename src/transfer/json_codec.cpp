#include <sluice/transfer/json_codec.hpp>

#include <spdlog/spdlog.h>

namespace sluice::transfer {

using json = nlohmann::json;

namespace {

template <typename T> void putOptional(json& j, const char* name, const std::optional<T>& v) {
    if (v) {
        j[name] = *v;
    }
}

template <typename T> std::optional<T> getOptional(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->template get<T>();
}

json partToJson(const storage::PartInfo& part) {
    return json{{"index", part.index}, {"size", part.size}, {"etag", part.etag},
                {"sha256", part.sha256}};
}

storage::PartInfo partFromJson(const json& j) {
    storage::PartInfo part;
    part.index = j.at("index").get<std::uint32_t>();
    part.size = j.at("size").get<std::uint64_t>();
    part.etag = j.value("etag", "");
    part.sha256 = j.value("sha256", "");
    return part;
}

} // namespace

std::optional<TransferStatus> parseStatus(std::string_view name) {
    for (auto status :
         {TransferStatus::InProgress, TransferStatus::Completed, TransferStatus::Failed}) {
        if (name == statusName(status)) {
            return status;
        }
    }
    return std::nullopt;
}

json stateToJson(const TransferState& state) {
    json j;
    j["version"] = TransferState::kVersion;
    j["key"] = state.key;
    j["attempt"] = state.attempt;
    j["status"] = statusName(state.status);
    j["source"] = state.source;
    j["destination"] = state.destination;
    j["resolvedKey"] = state.resolvedKey;
    j["chunkSize"] = state.chunkSize;
    j["bytesTransferred"] = state.bytesTransferred;
    j["sourceCursor"] = state.sourceCursor;
    putOptional(j, "totalBytes", state.totalBytes);

    json validator = json::object();
    putOptional(validator, "etag", state.validator.etag);
    putOptional(validator, "lastModified", state.validator.lastModified);
    j["validator"] = std::move(validator);

    putOptional(j, "contentType", state.contentType);

    if (state.resumeToken) {
        json parts = json::array();
        for (const auto& part : state.resumeToken->parts) {
            parts.push_back(partToJson(part));
        }
        j["resumeToken"] = json{{"uploadId", state.resumeToken->uploadId}, {"parts", parts}};
    }
    j["completing"] = state.completing;
    if (state.error) {
        j["error"] = json{{"kind", errorCodeName(state.error->code)},
                          {"message", state.error->message}};
    }
    putOptional(j, "location", state.location);
    return j;
}

Result<TransferState> stateFromJson(const json& j) {
    try {
        if (!j.is_object()) {
            return Error{ErrorCode::StateCorruption, "Transfer state is not a JSON object"};
        }
        auto version = j.value("version", 0);
        if (version != TransferState::kVersion) {
            return Error{ErrorCode::StateCorruption,
                         "Unsupported transfer state version " + std::to_string(version)};
        }

        TransferState state;
        state.key = j.at("key").get<std::string>();
        state.attempt = j.value("attempt", 1u);
        auto status = parseStatus(j.at("status").get<std::string>());
        if (!status) {
            return Error{ErrorCode::StateCorruption,
                         "Unknown transfer status '" + j.at("status").get<std::string>() + "'"};
        }
        state.status = *status;
        state.source = j.at("source").get<std::string>();
        state.destination = j.at("destination").get<std::string>();
        state.resolvedKey = j.value("resolvedKey", "");
        state.chunkSize = j.at("chunkSize").get<std::size_t>();
        state.bytesTransferred = j.at("bytesTransferred").get<std::uint64_t>();
        state.sourceCursor = j.at("sourceCursor").get<std::uint64_t>();
        state.totalBytes = getOptional<std::uint64_t>(j, "totalBytes");

        if (auto it = j.find("validator"); it != j.end() && it->is_object()) {
            state.validator.etag = getOptional<std::string>(*it, "etag");
            state.validator.lastModified = getOptional<std::string>(*it, "lastModified");
        }
        state.contentType = getOptional<std::string>(j, "contentType");

        if (auto it = j.find("resumeToken"); it != j.end() && !it->is_null()) {
            ResumeToken token;
            token.uploadId = it->at("uploadId").get<std::string>();
            for (const auto& p : it->value("parts", json::array())) {
                token.parts.push_back(partFromJson(p));
            }
            state.resumeToken = std::move(token);
        }
        state.completing = j.value("completing", false);

        if (auto it = j.find("error"); it != j.end() && it->is_object()) {
            state.error = Error{errorCodeFromName(it->value("kind", "internal_error")),
                                it->value("message", "")};
        }
        state.location = getOptional<std::string>(j, "location");

        if (state.chunkSize == 0) {
            return Error{ErrorCode::StateCorruption, "Transfer state has zero chunk size"};
        }
        if (state.resumeToken) {
            for (const auto& part : state.resumeToken->parts) {
                if (part.size > state.chunkSize) {
                    return Error{ErrorCode::StateCorruption,
                                 "Part " + std::to_string(part.index) + " of " +
                                     std::to_string(part.size) + " bytes exceeds chunk size " +
                                     std::to_string(state.chunkSize) + " in state " + state.key};
                }
            }
        }
        if (state.sourceCursor > state.bytesTransferred) {
            return Error{ErrorCode::StateCorruption,
                         "Source cursor ahead of committed bytes in state " + state.key};
        }
        return state;
    } catch (const json::exception& e) {
        return Error{ErrorCode::StateCorruption, std::string("Malformed transfer state: ") + e.what()};
    }
}

Result<TransferRequest> requestFromJson(const json& j) {
    try {
        if (!j.is_object()) {
            return Error{ErrorCode::InvalidRequest, "Request body must be a JSON object"};
        }
        TransferRequest req;
        req.url = j.value("url", "");

        if (auto it = j.find("request"); it != j.end() && !it->is_null()) {
            if (auto h = it->find("headers"); h != it->end() && !h->is_null()) {
                if (!h->is_object()) {
                    return Error{ErrorCode::InvalidRequest, "request.headers must be an object"};
                }
                for (const auto& [name, value] : h->items()) {
                    req.headers.push_back(Header{name, value.get<std::string>()});
                }
            }
            if (auto t = it->find("timeout"); t != it->end() && !t->is_null()) {
                Result<std::chrono::milliseconds> timeout =
                    t->is_number_unsigned()
                        ? Result<std::chrono::milliseconds>(
                              std::chrono::milliseconds(t->get<std::uint64_t>() * 1000))
                        : parseHumanDuration(t->get<std::string>());
                if (!timeout) {
                    return timeout.error();
                }
                req.timeout = timeout.value();
            }
        }

        auto out = j.find("output");
        if (out == j.end() || !out->is_object()) {
            return Error{ErrorCode::InvalidRequest, "output must be an object with a url"};
        }
        req.output.url = out->value("url", "");
        req.output.setContentType = out->value("setContentType", false);
        req.output.contentType = getOptional<std::string>(*out, "contentType");

        req.idempotencyKey = getOptional<std::string>(j, "idempotencyKey");
        req.invocationId = getOptional<std::string>(j, "invocationId");
        req.restart = j.value("restart", false);
        return req;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidRequest, std::string("Malformed request: ") + e.what()};
    }
}

Result<TransferRequest> requestFromJsonText(std::string_view text) {
    auto j = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return Error{ErrorCode::InvalidRequest, "Request is not valid JSON"};
    }
    return requestFromJson(j);
}

json requestToJson(const TransferRequest& request) {
    json j;
    j["url"] = request.url;
    json headers = json::object();
    for (const auto& h : request.headers) {
        headers[h.name] = h.value;
    }
    j["request"] = json{{"headers", headers}};
    if (request.timeout) {
        j["request"]["timeout"] = std::to_string(request.timeout->count()) + "ms";
    }
    j["output"] = json{{"url", request.output.url},
                       {"setContentType", request.output.setContentType}};
    putOptional(j["output"], "contentType", request.output.contentType);
    putOptional(j, "idempotencyKey", request.idempotencyKey);
    putOptional(j, "invocationId", request.invocationId);
    if (request.restart) {
        j["restart"] = true;
    }
    return j;
}

json resultToJson(const TransferResult& result) {
    return json{{"size", result.bytesTransferred},
                {"location", result.location},
                {"status", statusName(TransferStatus::Completed)}};
}

json errorToJson(const Error& error) {
    return json{{"error", {{"kind", errorCodeName(error.code)}, {"message", error.message}}}};
}

} // namespace sluice::transfer
