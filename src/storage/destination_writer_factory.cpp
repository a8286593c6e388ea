#include <sluice/storage/destination_writer.h>

#include <spdlog/spdlog.h>

namespace sluice::storage {

namespace fs = std::filesystem;

std::string DestinationLocation::url() const {
    return urlForKey(key);
}

std::string DestinationLocation::urlForKey(std::string_view objectKey) const {
    std::string out = std::string(schemeName(scheme)) + "://";
    if (scheme == DestinationScheme::Filesystem) {
        out += container;
        if (container.empty() || container.back() != '/') {
            out.push_back('/');
        }
    } else {
        out += container + "/";
    }
    out.append(objectKey);
    return out;
}

Result<DestinationLocation> DestinationWriterFactory::parseLocation(std::string_view url) {
    if (url.empty()) {
        return Error{ErrorCode::InvalidRequest, "Destination URL is empty"};
    }

    DestinationLocation loc;
    auto schemeEnd = url.find("://");

    if (schemeEnd == std::string_view::npos || url.substr(0, schemeEnd) == "file") {
        loc.scheme = DestinationScheme::Filesystem;
        std::string path(schemeEnd == std::string_view::npos ? url : url.substr(schemeEnd + 3));
        if (path.empty()) {
            return Error{ErrorCode::InvalidRequest, "Destination path is empty"};
        }
        const bool prefix = path.back() == '/';
        fs::path p = fs::absolute(fs::path(path)).lexically_normal();
        if (prefix) {
            auto dir = p.string();
            while (dir.size() > 1 && dir.back() == '/') {
                dir.pop_back();
            }
            loc.container = dir;
            loc.key = "";
        } else {
            if (!p.has_filename()) {
                return Error{ErrorCode::InvalidRequest,
                             "Destination path has no file name: " + path};
            }
            loc.container = p.parent_path().string();
            loc.key = p.filename().string();
        }
        return loc;
    }

    auto scheme = url.substr(0, schemeEnd);
    if (scheme == "s3") {
        loc.scheme = DestinationScheme::S3;
    } else if (scheme == "mem") {
        loc.scheme = DestinationScheme::Memory;
    } else {
        return Error{ErrorCode::InvalidRequest,
                     "Unsupported destination scheme: " + std::string(scheme)};
    }

    auto rest = url.substr(schemeEnd + 3);
    auto slash = rest.find('/');
    loc.container = std::string(rest.substr(0, slash));
    // s3://bucket is the bucket root, a prefix with an empty key
    if (slash != std::string_view::npos) {
        loc.key = std::string(rest.substr(slash + 1));
    }
    if (loc.container.empty()) {
        return Error{ErrorCode::InvalidRequest, "Destination has no bucket: " + std::string(url)};
    }
    if (loc.key.find("//") != std::string::npos) {
        return Error{ErrorCode::InvalidRequest,
                     "Destination key has an empty path segment: " + std::string(url)};
    }
    return loc;
}

Result<std::unique_ptr<IDestinationWriter>>
DestinationWriterFactory::create(const DestinationLocation& location,
                                 const DestinationConfig& config) {
    switch (location.scheme) {
        case DestinationScheme::S3:
            return std::unique_ptr<IDestinationWriter>(
                std::make_unique<S3DestinationWriter>(config.s3, location.container));
        case DestinationScheme::Filesystem:
            return std::unique_ptr<IDestinationWriter>(
                std::make_unique<FilesystemDestinationWriter>(fs::path(location.container)));
        case DestinationScheme::Memory:
            if (!config.memoryStore) {
                return Error{ErrorCode::InvalidConfig,
                             "mem:// destination requires an in-process object store"};
            }
            return std::unique_ptr<IDestinationWriter>(
                std::make_unique<MemoryDestinationWriter>(config.memoryStore,
                                                          location.container));
    }
    spdlog::error("Unknown destination scheme for {}", location.url());
    return Error{ErrorCode::InvalidRequest, "Unknown destination scheme"};
}

} // namespace sluice::storage
