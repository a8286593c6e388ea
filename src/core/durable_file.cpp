#include <sluice/core/durable_file.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <string>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace sluice::core {

namespace fs = std::filesystem;

namespace {

std::error_code lastError() {
    return std::error_code(errno, std::generic_category());
}

std::string tempNameFor(const fs::path& target) {
    static std::atomic<unsigned long> counter{0};
    return "." + target.filename().string() + ".tmp-" + std::to_string(::getpid()) + "-" +
           std::to_string(counter.fetch_add(1));
}

} // namespace

std::error_code fsyncFile(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return lastError();
    }
    if (::fsync(fd) != 0) {
        auto ec = lastError();
        ::close(fd);
        return ec;
    }
    ::close(fd);
    return {};
}

std::error_code fsyncDir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return lastError();
    }
    if (::fsync(fd) != 0) {
        auto ec = lastError();
        ::close(fd);
        return ec;
    }
    ::close(fd);
    return {};
}

std::error_code writeFileAtomically(const fs::path& target, std::span<const std::byte> data) {
    const fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");
    const fs::path tmp = dir / tempNameFor(target);

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return lastError();
    }

    const auto* p = reinterpret_cast<const char*>(data.data());
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, p, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto ec = lastError();
            ::close(fd);
            ::unlink(tmp.c_str());
            return ec;
        }
        p += n;
        remaining -= static_cast<std::size_t>(n);
    }

    if (::fsync(fd) != 0) {
        auto ec = lastError();
        ::close(fd);
        ::unlink(tmp.c_str());
        return ec;
    }
    ::close(fd);

    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        auto ec = lastError();
        ::unlink(tmp.c_str());
        return ec;
    }

    if (auto ec = fsyncDir(dir); ec) {
        spdlog::debug("fsync(dir) failed for {}: {}", dir.string(), ec.message());
        return ec;
    }
    return {};
}

} // namespace sluice::core
