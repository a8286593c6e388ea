/*
 * Local filesystem destination:
 * - Parts are staged as <base>/.sluice-uploads/<uploadId>/part-NNNNN (atomic write each)
 * - complete() concatenates parts into a temp file beside the target and renames it into place
 * - A missing upload directory means the upload expired (or was aborted)
 */

#include <sluice/core/durable_file.h>
#include <sluice/crypto/hasher.h>
#include <sluice/storage/destination_writer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <random>
#include <system_error>

namespace sluice::storage {

namespace fs = std::filesystem;

namespace {

constexpr const char* kUploadsDir = ".sluice-uploads";
constexpr const char* kKeyFile = "key";

Error mapIoError(const std::error_code& ec, std::string_view what, const fs::path& p) {
    std::string msg = std::string(what) + " " + p.string() + ": " + ec.message();
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        return Error{ErrorCode::DestinationDenied, std::move(msg)};
    }
    return Error{ErrorCode::DestinationUnreachable, std::move(msg)};
}

std::string randomUploadId() {
    static const char* hex = "0123456789abcdef";
    std::random_device rd;
    std::string id;
    id.reserve(32);
    for (int i = 0; i < 32; ++i) {
        id.push_back(hex[rd() & 0xF]);
    }
    return id;
}

std::span<const std::byte> asBytes(const std::string& s) {
    return std::as_bytes(std::span<const char>(s.data(), s.size()));
}

Result<std::vector<std::byte>> readWholeFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        return mapIoError(std::error_code(errno, std::generic_category()), "open", p);
    }
    std::vector<char> buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<std::byte> out(buf.size());
    std::transform(buf.begin(), buf.end(), out.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return out;
}

} // namespace

FilesystemDestinationWriter::FilesystemDestinationWriter(fs::path basePath)
    : basePath_(std::move(basePath)) {}

std::string FilesystemDestinationWriter::partFileName(std::uint32_t index) {
    std::array<char, 32> buf{};
    std::snprintf(buf.data(), buf.size(), "part-%05u", index);
    return std::string(buf.data());
}

fs::path FilesystemDestinationWriter::objectPath(std::string_view key) const {
    return basePath_ / fs::path(std::string(key));
}

fs::path FilesystemDestinationWriter::uploadDir(std::string_view uploadId) const {
    return basePath_ / kUploadsDir / std::string(uploadId);
}

Result<std::string> FilesystemDestinationWriter::initiate(std::string_view key,
                                                          const UploadOptions& /*options*/) {
    auto target = objectPath(key).lexically_normal();
    auto rel = target.lexically_relative(basePath_.lexically_normal());
    if (key.empty() || rel.empty() || *rel.begin() == "..") {
        return Error{ErrorCode::DestinationDenied,
                     "Object key escapes destination directory: " + std::string(key)};
    }

    std::string uploadId = randomUploadId();
    auto dir = uploadDir(uploadId);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return mapIoError(ec, "create upload dir", dir);
    }
    if (auto wec = core::writeFileAtomically(dir / kKeyFile, asBytes(std::string(key))); wec) {
        return mapIoError(wec, "write", dir / kKeyFile);
    }

    spdlog::debug("file upload {} started for {}", uploadId, target.string());
    return uploadId;
}

Result<PartInfo> FilesystemDestinationWriter::writePart(std::string_view /*key*/,
                                                        std::string_view uploadId,
                                                        std::uint32_t index,
                                                        std::span<const std::byte> data) {
    auto dir = uploadDir(uploadId);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Error{ErrorCode::DestinationUploadExpired,
                     "No such upload: " + std::string(uploadId)};
    }

    auto partPath = dir / partFileName(index);
    if (auto wec = core::writeFileAtomically(partPath, data); wec) {
        return mapIoError(wec, "write part", partPath);
    }

    PartInfo part;
    part.index = index;
    part.size = data.size();
    part.sha256 = crypto::SHA256Hasher::hash(data);
    part.etag = part.sha256.substr(0, 32);
    return part;
}

Result<std::string> FilesystemDestinationWriter::complete(std::string_view key,
                                                          std::string_view uploadId,
                                                          const std::vector<PartInfo>& parts) {
    auto dir = uploadDir(uploadId);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Error{ErrorCode::DestinationUploadExpired,
                     "No such upload: " + std::string(uploadId)};
    }

    auto target = objectPath(key);
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return mapIoError(ec, "create directory", target.parent_path());
    }

    auto assembling = target.parent_path() / ("." + target.filename().string() + ".sluice-" +
                                              std::string(uploadId));
    {
        std::ofstream out(assembling, std::ios::binary | std::ios::trunc);
        if (!out) {
            return mapIoError(std::error_code(errno, std::generic_category()), "create",
                              assembling);
        }
        for (const auto& part : parts) {
            auto partPath = dir / partFileName(part.index);
            auto size = fs::file_size(partPath, ec);
            if (ec || size != part.size) {
                out.close();
                fs::remove(assembling, ec);
                return Error{ErrorCode::DestinationDenied,
                             "Part " + std::to_string(part.index) + " missing or wrong size in " +
                                 dir.string()};
            }
            if (size == 0) {
                continue;
            }
            std::ifstream in(partPath, std::ios::binary);
            out << in.rdbuf();
        }
        out.flush();
        if (!out) {
            out.close();
            fs::remove(assembling, ec);
            return Error{ErrorCode::DestinationUnreachable,
                         "Failed writing assembled object " + assembling.string()};
        }
    }

    if (auto sec = core::fsyncFile(assembling); sec) {
        fs::remove(assembling, ec);
        return mapIoError(sec, "fsync", assembling);
    }
    fs::rename(assembling, target, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(assembling, rmEc);
        return mapIoError(ec, "rename", target);
    }
    if (auto dec = core::fsyncDir(target.parent_path()); dec) {
        spdlog::warn("fsync of {} failed: {}", target.parent_path().string(), dec.message());
    }

    fs::remove_all(dir, ec);
    if (ec) {
        spdlog::warn("Failed to clean upload dir {}: {}", dir.string(), ec.message());
    }

    return "file://" + fs::absolute(target).lexically_normal().string();
}

Result<void> FilesystemDestinationWriter::abort(std::string_view /*key*/,
                                                std::string_view uploadId) {
    auto dir = uploadDir(uploadId);
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        return mapIoError(ec, "remove", dir);
    }
    return {};
}

Result<std::vector<PartInfo>> FilesystemDestinationWriter::reopen(std::string_view key,
                                                                  std::string_view uploadId) {
    auto dir = uploadDir(uploadId);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Error{ErrorCode::DestinationUploadExpired,
                     "No such upload: " + std::string(uploadId)};
    }

    auto recordedKey = readWholeFile(dir / kKeyFile);
    if (recordedKey) {
        const auto& bytes = recordedKey.value();
        std::string stored(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        if (stored != key) {
            return Error{ErrorCode::DestinationUploadExpired,
                         "Upload " + std::string(uploadId) + " belongs to another object"};
        }
    }

    std::vector<PartInfo> parts;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        auto name = entry.path().filename().string();
        if (name.rfind("part-", 0) != 0 || name.size() != 10) {
            continue;
        }
        PartInfo part;
        try {
            part.index = static_cast<std::uint32_t>(std::stoul(name.substr(5)));
        } catch (const std::exception&) {
            continue;
        }
        part.size = entry.file_size(ec);
        if (ec) {
            return mapIoError(ec, "stat", entry.path());
        }
        auto hasher = crypto::createSHA256Hasher();
        auto digest = hasher->hashFile(entry.path());
        if (!digest) {
            return Error{ErrorCode::DestinationUnreachable, digest.error().message};
        }
        part.sha256 = digest.value();
        part.etag = part.sha256.substr(0, 32);
        parts.push_back(std::move(part));
    }
    if (ec) {
        return mapIoError(ec, "list", dir);
    }

    std::sort(parts.begin(), parts.end(),
              [](const PartInfo& a, const PartInfo& b) { return a.index < b.index; });
    return parts;
}

Result<std::optional<std::uint64_t>> FilesystemDestinationWriter::stat(std::string_view key) {
    auto target = objectPath(key);
    std::error_code ec;
    if (!fs::exists(target, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return mapIoError(ec, "stat", target);
        }
        return std::optional<std::uint64_t>{};
    }
    auto size = fs::file_size(target, ec);
    if (ec) {
        return mapIoError(ec, "stat", target);
    }
    return std::optional<std::uint64_t>{size};
}

} // namespace sluice::storage
