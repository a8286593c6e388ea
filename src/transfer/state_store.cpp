/*
 * Transfer state stores.
 *
 * - InMemoryStateStore: per-process table, leases tracked in a set (tests, --dry-run)
 * - FileStateStore: <dir>/<key>.json written atomically (temp + fsync + rename);
 *   leases are non-blocking flock() on <dir>/<key>.lock, released by the kernel if the
 *   holder dies
 */

#include <sluice/core/durable_file.h>
#include <sluice/transfer/json_codec.hpp>
#include <sluice/transfer/transfer.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <shared_mutex>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace sluice::transfer {

namespace fs = std::filesystem;

namespace {

bool isSafeStateKey(std::string_view key) {
    return !key.empty() && key.size() <= 128 && key != "." && key != ".." &&
           std::all_of(key.begin(), key.end(), [](unsigned char c) {
               return std::isalnum(c) || c == '-' || c == '_' || c == '.';
           });
}

} // namespace

class InMemoryStateStore final : public IStateStore,
                                 public std::enable_shared_from_this<InMemoryStateStore> {
public:
    Result<std::optional<TransferState>> load(std::string_view key) override {
        if (key.empty()) {
            return Error{ErrorCode::InvalidRequest, "StateStore.load: empty key"};
        }
        std::shared_lock lk(mutex_);
        auto it = table_.find(std::string(key));
        if (it == table_.end()) {
            return std::optional<TransferState>{std::nullopt};
        }
        return std::optional<TransferState>{it->second};
    }

    Result<void> save(std::string_view key, const TransferState& state) override {
        if (key.empty()) {
            return Error{ErrorCode::InvalidRequest, "StateStore.save: empty key"};
        }
        {
            std::unique_lock lk(mutex_);
            table_[std::string(key)] = state;
        }
        spdlog::debug("StateStore: saved key={} status={} bytes={}", key,
                      statusName(state.status), state.bytesTransferred);
        return {};
    }

    Result<void> remove(std::string_view key) override {
        std::unique_lock lk(mutex_);
        table_.erase(std::string(key));
        return {};
    }

    Result<Lease> acquire(std::string_view key, std::string_view owner) override {
        std::unique_lock lk(mutex_);
        auto [it, inserted] = leases_.emplace(std::string(key), std::string(owner));
        if (!inserted) {
            return Error{ErrorCode::TransferInProgress,
                         "Transfer " + std::string(key) + " is held by " + it->second};
        }
        std::weak_ptr<InMemoryStateStore> weak = weak_from_this();
        std::string k(key);
        return Lease(k, [weak, k]() {
            if (auto self = weak.lock()) {
                std::unique_lock lk(self->mutex_);
                self->leases_.erase(k);
            }
        });
    }

private:
    std::unordered_map<std::string, TransferState> table_;
    std::unordered_map<std::string, std::string> leases_; // key -> owner
    mutable std::shared_mutex mutex_;
};

class FileStateStore final : public IStateStore {
public:
    explicit FileStateStore(fs::path dir) : dir_(std::move(dir)) {}

    Result<std::optional<TransferState>> load(std::string_view key) override {
        if (!isSafeStateKey(key)) {
            return Error{ErrorCode::InvalidRequest, "Invalid state key: " + std::string(key)};
        }
        auto path = statePath(key);
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            if (ec) {
                return Error{ErrorCode::StateUnavailable,
                             "Cannot stat " + path.string() + ": " + ec.message()};
            }
            return std::optional<TransferState>{std::nullopt};
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Error{ErrorCode::StateUnavailable,
                         "Cannot open " + path.string() + ": " + std::strerror(errno)};
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        auto text = buffer.str();

        auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded()) {
            return Error{ErrorCode::StateCorruption, "Unparseable transfer state " + path.string()};
        }
        auto state = stateFromJson(j);
        if (!state) {
            return state.error();
        }
        if (state.value().key != key) {
            return Error{ErrorCode::StateCorruption,
                         "State file " + path.string() + " records key " + state.value().key};
        }
        return std::optional<TransferState>{std::move(state).value()};
    }

    Result<void> save(std::string_view key, const TransferState& state) override {
        if (!isSafeStateKey(key)) {
            return Error{ErrorCode::InvalidRequest, "Invalid state key: " + std::string(key)};
        }
        auto text = stateToJson(state).dump(2);
        auto path = statePath(key);
        if (auto ec = core::writeFileAtomically(
                path, std::as_bytes(std::span<const char>(text.data(), text.size())));
            ec) {
            return Error{ErrorCode::StateUnavailable,
                         "Failed to persist " + path.string() + ": " + ec.message()};
        }
        spdlog::debug("StateStore: saved {} status={} bytes={}", path.string(),
                      statusName(state.status), state.bytesTransferred);
        return {};
    }

    Result<void> remove(std::string_view key) override {
        if (!isSafeStateKey(key)) {
            return Error{ErrorCode::InvalidRequest, "Invalid state key: " + std::string(key)};
        }
        std::error_code ec;
        fs::remove(statePath(key), ec);
        if (ec) {
            return Error{ErrorCode::StateUnavailable,
                         "Failed to remove state " + std::string(key) + ": " + ec.message()};
        }
        return {};
    }

    Result<Lease> acquire(std::string_view key, std::string_view owner) override {
        if (!isSafeStateKey(key)) {
            return Error{ErrorCode::InvalidRequest, "Invalid state key: " + std::string(key)};
        }
        auto lockPath = dir_ / (std::string(key) + ".lock");
        int fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd < 0) {
            return Error{ErrorCode::StateUnavailable,
                         "Cannot open lock " + lockPath.string() + ": " + std::strerror(errno)};
        }
        if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
            int err = errno;
            ::close(fd);
            if (err == EWOULDBLOCK) {
                return Error{ErrorCode::TransferInProgress,
                             "Transfer " + std::string(key) + " is locked by another invocation"};
            }
            return Error{ErrorCode::StateUnavailable,
                         "flock " + lockPath.string() + ": " + std::strerror(err)};
        }

        // Record the holder for diagnostics; the lock itself is the flock
        std::string label = std::string(owner) + " pid=" + std::to_string(::getpid()) + "\n";
        if (::ftruncate(fd, 0) != 0 || ::write(fd, label.data(), label.size()) < 0) {
            spdlog::debug("Could not record lease owner in {}", lockPath.string());
        }

        return Lease(std::string(key), [fd]() {
            ::flock(fd, LOCK_UN);
            ::close(fd);
        });
    }

private:
    fs::path statePath(std::string_view key) const { return dir_ / (std::string(key) + ".json"); }

    fs::path dir_;
};

std::shared_ptr<IStateStore> makeInMemoryStateStore() {
    return std::make_shared<InMemoryStateStore>();
}

Result<std::shared_ptr<IStateStore>> makeFileStateStore(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::StateUnavailable,
                     "Cannot create state directory " + dir.string() + ": " + ec.message()};
    }
    std::shared_ptr<IStateStore> store = std::make_shared<FileStateStore>(dir);
    return store;
}

} // namespace sluice::transfer
