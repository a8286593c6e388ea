#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <sluice/core/types.h>

namespace sluice::storage {

/**
 * Destination backends. Closed set: every destination URL maps to exactly one of these.
 */
enum class DestinationScheme { S3, Filesystem, Memory };

constexpr const char* schemeName(DestinationScheme scheme) {
    switch (scheme) {
        case DestinationScheme::S3: return "s3";
        case DestinationScheme::Filesystem: return "file";
        case DestinationScheme::Memory: return "mem";
    }
    return "file";
}

/**
 * Parsed destination: bucket/base directory/container plus object key.
 * A key that is empty or ends with '/' is a prefix; the object name is resolved later.
 */
struct DestinationLocation {
    DestinationScheme scheme{DestinationScheme::Filesystem};
    std::string container;
    std::string key;

    bool isPrefix() const { return key.empty() || key.back() == '/'; }

    // Canonical URL form, e.g. s3://bucket/key, file:///base/key, mem://container/key
    std::string url() const;
    std::string urlForKey(std::string_view objectKey) const;
};

/**
 * S3 endpoint and credential configuration
 */
struct S3Config {
    std::string endpoint; // e.g. https://s3.us-east-1.amazonaws.com or http://127.0.0.1:9000
    std::string region = "us-east-1";
    bool usePathStyle = false;
    long requestTimeoutMs = 300000;
    long connectTimeoutMs = 30000;

    // access_key, secret_key, session_token (falls back to AWS_* env vars when empty)
    std::unordered_map<std::string, std::string> credentials;
};

struct UploadOptions {
    std::optional<std::string> contentType;
};

/**
 * One durably committed part of an in-progress upload.
 * index is 1-based and derived from the byte offset, never from call count.
 */
struct PartInfo {
    std::uint32_t index{0};
    std::uint64_t size{0};
    std::string etag;
    std::string sha256;
};

/**
 * Multipart upload primitives shared by every destination backend.
 * A part write either lands durably or fails with no partial part visible;
 * complete() is the only point at which the object becomes visible.
 */
class IDestinationWriter {
public:
    virtual ~IDestinationWriter() = default;

    /**
     * Start a new upload for key; returns the backend upload identifier.
     */
    virtual Result<std::string> initiate(std::string_view key, const UploadOptions& options) = 0;

    /**
     * Write (or overwrite) part `index` of the upload.
     */
    virtual Result<PartInfo> writePart(std::string_view key, std::string_view uploadId,
                                       std::uint32_t index, std::span<const std::byte> data) = 0;

    /**
     * Commit parts (ordered by index) into the final object; returns its location URL.
     */
    virtual Result<std::string> complete(std::string_view key, std::string_view uploadId,
                                         const std::vector<PartInfo>& parts) = 0;

    virtual Result<void> abort(std::string_view key, std::string_view uploadId) = 0;

    /**
     * Reattach to an upload and report the parts the backend holds, ordered by index.
     * Fails with DestinationUploadExpired when the upload no longer exists.
     */
    virtual Result<std::vector<PartInfo>> reopen(std::string_view key,
                                                 std::string_view uploadId) = 0;

    /**
     * Size of the committed object at key, or nullopt when there is none.
     */
    virtual Result<std::optional<std::uint64_t>> stat(std::string_view key) = 0;

    virtual std::string getType() const = 0;

    /**
     * Smallest size accepted for any part but the last (0 = no constraint).
     */
    virtual std::uint64_t minPartSize() const { return 0; }
};

/**
 * S3 multipart upload over libcurl, signed with AWS Signature V4
 */
class S3DestinationWriter : public IDestinationWriter {
public:
    S3DestinationWriter(S3Config config, std::string bucket);
    ~S3DestinationWriter() override;

    Result<std::string> initiate(std::string_view key, const UploadOptions& options) override;
    Result<PartInfo> writePart(std::string_view key, std::string_view uploadId,
                               std::uint32_t index, std::span<const std::byte> data) override;
    Result<std::string> complete(std::string_view key, std::string_view uploadId,
                                 const std::vector<PartInfo>& parts) override;
    Result<void> abort(std::string_view key, std::string_view uploadId) override;
    Result<std::vector<PartInfo>> reopen(std::string_view key, std::string_view uploadId) override;
    Result<std::optional<std::uint64_t>> stat(std::string_view key) override;

    std::string getType() const override { return "s3"; }
    std::uint64_t minPartSize() const override { return S3_MIN_PART_SIZE; }

    // Request URL for an object (virtual-hosted or path style per config)
    std::string objectUrl(std::string_view key, std::string_view query = {}) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * Local filesystem backend: parts staged under <base>/.sluice-uploads/<uploadId>/
 */
class FilesystemDestinationWriter : public IDestinationWriter {
public:
    explicit FilesystemDestinationWriter(std::filesystem::path basePath);

    Result<std::string> initiate(std::string_view key, const UploadOptions& options) override;
    Result<PartInfo> writePart(std::string_view key, std::string_view uploadId,
                               std::uint32_t index, std::span<const std::byte> data) override;
    Result<std::string> complete(std::string_view key, std::string_view uploadId,
                                 const std::vector<PartInfo>& parts) override;
    Result<void> abort(std::string_view key, std::string_view uploadId) override;
    Result<std::vector<PartInfo>> reopen(std::string_view key, std::string_view uploadId) override;
    Result<std::optional<std::uint64_t>> stat(std::string_view key) override;

    std::string getType() const override { return "file"; }

private:
    std::filesystem::path basePath_;

    std::filesystem::path objectPath(std::string_view key) const;
    std::filesystem::path uploadDir(std::string_view uploadId) const;
    static std::string partFileName(std::uint32_t index);
};

/**
 * In-process object store shared by MemoryDestinationWriter instances.
 * Supports fault injection so tests can exercise every failure classification.
 */
class MemoryObjectStore {
public:
    enum class Operation { Initiate, WritePart, Complete, Abort, Reopen, Stat };

    struct StoredObject {
        std::vector<std::byte> data;
        std::optional<std::string> contentType;
    };

    struct PartWrite {
        std::string uploadId;
        std::uint32_t index{0};
        std::string sha256;
    };

    // Fail the next `times` calls of `op` with `code`
    void failNext(Operation op, ErrorCode code, int times = 1);
    // Drop an in-progress upload as if the backend had expired it
    void expireUpload(std::string_view uploadId);

    std::optional<StoredObject> getObject(std::string_view container, std::string_view key) const;
    bool hasUpload(std::string_view uploadId) const;
    std::size_t openUploadCount() const;
    std::vector<PartWrite> partWrites() const;
    std::size_t abortCount() const;

private:
    friend class MemoryDestinationWriter;

    struct Upload {
        std::string container;
        std::string key;
        std::optional<std::string> contentType;
        std::map<std::uint32_t, std::vector<std::byte>> parts;
    };

    struct Fault {
        ErrorCode code{ErrorCode::Success};
        int remaining{0};
    };

    Result<void> takeFault(Operation op);

    mutable std::mutex mutex_;
    std::map<std::string, StoredObject> objects_; // "container/key"
    std::map<std::string, Upload> uploads_;
    std::map<Operation, Fault> faults_;
    std::vector<PartWrite> partWrites_;
    std::size_t aborts_{0};
    std::uint64_t nextUploadId_{1};
};

/**
 * Writer over a MemoryObjectStore container (mem://container/key)
 */
class MemoryDestinationWriter : public IDestinationWriter {
public:
    MemoryDestinationWriter(std::shared_ptr<MemoryObjectStore> store, std::string container);

    Result<std::string> initiate(std::string_view key, const UploadOptions& options) override;
    Result<PartInfo> writePart(std::string_view key, std::string_view uploadId,
                               std::uint32_t index, std::span<const std::byte> data) override;
    Result<std::string> complete(std::string_view key, std::string_view uploadId,
                                 const std::vector<PartInfo>& parts) override;
    Result<void> abort(std::string_view key, std::string_view uploadId) override;
    Result<std::vector<PartInfo>> reopen(std::string_view key, std::string_view uploadId) override;
    Result<std::optional<std::uint64_t>> stat(std::string_view key) override;

    std::string getType() const override { return "mem"; }

private:
    std::shared_ptr<MemoryObjectStore> store_;
    std::string container_;
};

/**
 * Backend selection for destination locations
 */
struct DestinationConfig {
    S3Config s3;
    std::shared_ptr<MemoryObjectStore> memoryStore; // required for mem:// destinations
};

class DestinationWriterFactory {
public:
    /**
     * Parse s3://bucket/key, file:///path, a bare local path, or mem://container/key.
     * A trailing '/' marks a prefix destination; s3:// and mem:// URLs naming only the
     * container are prefixes at its root.
     */
    static Result<DestinationLocation> parseLocation(std::string_view url);

    static Result<std::unique_ptr<IDestinationWriter>> create(const DestinationLocation& location,
                                                              const DestinationConfig& config);
};

} // namespace sluice::storage
