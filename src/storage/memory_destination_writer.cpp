#include <sluice/crypto/hasher.h>
#include <sluice/storage/destination_writer.h>

#include <spdlog/spdlog.h>

namespace sluice::storage {

namespace {
std::string objectId(std::string_view container, std::string_view key) {
    return std::string(container) + "/" + std::string(key);
}
} // namespace

void MemoryObjectStore::failNext(Operation op, ErrorCode code, int times) {
    std::lock_guard<std::mutex> lock(mutex_);
    faults_[op] = Fault{code, times};
}

void MemoryObjectStore::expireUpload(std::string_view uploadId) {
    std::lock_guard<std::mutex> lock(mutex_);
    uploads_.erase(std::string(uploadId));
}

std::optional<MemoryObjectStore::StoredObject>
MemoryObjectStore::getObject(std::string_view container, std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(objectId(container, key));
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryObjectStore::hasUpload(std::string_view uploadId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_.count(std::string(uploadId)) > 0;
}

std::size_t MemoryObjectStore::openUploadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_.size();
}

std::vector<MemoryObjectStore::PartWrite> MemoryObjectStore::partWrites() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return partWrites_;
}

std::size_t MemoryObjectStore::abortCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aborts_;
}

// Caller holds mutex_
Result<void> MemoryObjectStore::takeFault(Operation op) {
    auto it = faults_.find(op);
    if (it == faults_.end() || it->second.remaining <= 0) {
        return {};
    }
    auto code = it->second.code;
    if (--it->second.remaining == 0) {
        faults_.erase(it);
    }
    return Error{code, std::string("injected fault: ") + errorToString(code)};
}

MemoryDestinationWriter::MemoryDestinationWriter(std::shared_ptr<MemoryObjectStore> store,
                                                 std::string container)
    : store_(std::move(store)), container_(std::move(container)) {}

Result<std::string> MemoryDestinationWriter::initiate(std::string_view key,
                                                      const UploadOptions& options) {
    std::lock_guard<std::mutex> lock(store_->mutex_);
    if (auto fault = store_->takeFault(MemoryObjectStore::Operation::Initiate); !fault) {
        return fault.error();
    }
    std::string uploadId = "mem-upload-" + std::to_string(store_->nextUploadId_++);
    MemoryObjectStore::Upload upload;
    upload.container = container_;
    upload.key = std::string(key);
    upload.contentType = options.contentType;
    store_->uploads_.emplace(uploadId, std::move(upload));
    return uploadId;
}

Result<PartInfo> MemoryDestinationWriter::writePart(std::string_view key, std::string_view uploadId,
                                                    std::uint32_t index,
                                                    std::span<const std::byte> data) {
    std::lock_guard<std::mutex> lock(store_->mutex_);
    if (auto fault = store_->takeFault(MemoryObjectStore::Operation::WritePart); !fault) {
        return fault.error();
    }
    auto it = store_->uploads_.find(std::string(uploadId));
    if (it == store_->uploads_.end() || it->second.key != key) {
        return Error{ErrorCode::DestinationUploadExpired,
                     "No such upload: " + std::string(uploadId)};
    }
    if (index == 0) {
        return Error{ErrorCode::InternalError, "Part numbers start at 1"};
    }

    it->second.parts[index] = std::vector<std::byte>(data.begin(), data.end());

    PartInfo part;
    part.index = index;
    part.size = data.size();
    part.sha256 = crypto::SHA256Hasher::hash(data);
    part.etag = "\"" + part.sha256.substr(0, 32) + "\"";
    store_->partWrites_.push_back({std::string(uploadId), index, part.sha256});
    return part;
}

Result<std::string> MemoryDestinationWriter::complete(std::string_view key,
                                                      std::string_view uploadId,
                                                      const std::vector<PartInfo>& parts) {
    std::lock_guard<std::mutex> lock(store_->mutex_);
    if (auto fault = store_->takeFault(MemoryObjectStore::Operation::Complete); !fault) {
        return fault.error();
    }
    auto it = store_->uploads_.find(std::string(uploadId));
    if (it == store_->uploads_.end() || it->second.key != key) {
        return Error{ErrorCode::DestinationUploadExpired,
                     "No such upload: " + std::string(uploadId)};
    }

    MemoryObjectStore::StoredObject object;
    object.contentType = it->second.contentType;
    for (const auto& part : parts) {
        auto p = it->second.parts.find(part.index);
        if (p == it->second.parts.end() || p->second.size() != part.size) {
            return Error{ErrorCode::DestinationDenied,
                         "Invalid part " + std::to_string(part.index) + " for upload " +
                             std::string(uploadId)};
        }
        object.data.insert(object.data.end(), p->second.begin(), p->second.end());
    }

    store_->objects_[objectId(container_, key)] = std::move(object);
    store_->uploads_.erase(it);
    spdlog::debug("mem://{}/{} committed from {} parts", container_, key, parts.size());
    return "mem://" + objectId(container_, key);
}

Result<void> MemoryDestinationWriter::abort(std::string_view /*key*/, std::string_view uploadId) {
    std::lock_guard<std::mutex> lock(store_->mutex_);
    if (auto fault = store_->takeFault(MemoryObjectStore::Operation::Abort); !fault) {
        return fault.error();
    }
    store_->uploads_.erase(std::string(uploadId));
    ++store_->aborts_;
    return {};
}

Result<std::vector<PartInfo>> MemoryDestinationWriter::reopen(std::string_view key,
                                                              std::string_view uploadId) {
    std::lock_guard<std::mutex> lock(store_->mutex_);
    if (auto fault = store_->takeFault(MemoryObjectStore::Operation::Reopen); !fault) {
        return fault.error();
    }
    auto it = store_->uploads_.find(std::string(uploadId));
    if (it == store_->uploads_.end() || it->second.key != key) {
        return Error{ErrorCode::DestinationUploadExpired,
                     "No such upload: " + std::string(uploadId)};
    }

    std::vector<PartInfo> parts;
    for (const auto& [index, data] : it->second.parts) {
        PartInfo part;
        part.index = index;
        part.size = data.size();
        part.sha256 = crypto::SHA256Hasher::hash(std::span<const std::byte>(data));
        part.etag = "\"" + part.sha256.substr(0, 32) + "\"";
        parts.push_back(std::move(part));
    }
    return parts;
}

Result<std::optional<std::uint64_t>> MemoryDestinationWriter::stat(std::string_view key) {
    std::lock_guard<std::mutex> lock(store_->mutex_);
    if (auto fault = store_->takeFault(MemoryObjectStore::Operation::Stat); !fault) {
        return fault.error();
    }
    auto it = store_->objects_.find(objectId(container_, key));
    if (it == store_->objects_.end()) {
        return std::optional<std::uint64_t>{};
    }
    return std::optional<std::uint64_t>{it->second.data.size()};
}

} // namespace sluice::storage
