#include "lock/LocalDriveClient.hpp"
#include "util/files.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Exclusive flock on the drive's guard file. Serializes record changes
// between every client of the drive, in this process or another.
class DriveGuard {
public:
    explicit DriveGuard(const fs::path& path) {
        fd_ = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd_ < 0) throw std::system_error(errno, std::generic_category(), "open " + path.string());

        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd_);
            throw std::system_error(err, std::generic_category(), "flock " + path.string());
        }
    }

    ~DriveGuard() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    DriveGuard(const DriveGuard&) = delete;
    DriveGuard& operator=(const DriveGuard&) = delete;

private:
    int fd_ = -1;
};

std::atomic<uint64_t> tmpCounter{0};

}

using namespace dl::lock;
using namespace dl;

LocalDriveClient::LocalDriveClient(const config::DriveConfig& cfg)
    : lockDir_(cfg.lock_dir), owner_(resolveOwner(cfg.owner)) {
    if (cfg.roots.empty()) throw std::invalid_argument("No managed drive roots configured");
    if (lockDir_.empty()) throw std::invalid_argument("Lock directory name cannot be empty");

    for (const auto& root : cfg.roots) {
        if (!fs::is_directory(root))
            throw std::runtime_error("Managed drive root is not a directory: " + root.string());
        roots_.push_back(fs::canonical(root));
    }

    log::Registry::drive()->info("[LocalDriveClient] Serving {} drive root(s) as {}", roots_.size(), owner_);
}

std::string LocalDriveClient::resolveOwner(const std::string& configured) {
    if (!configured.empty()) return configured;
    if (const char* user = std::getenv("USER"); user && *user) return user;
    return "unknown";
}

std::optional<fs::path> LocalDriveClient::rootOf(const fs::path& path) const {
    for (const auto& root : roots_)
        if (util::isUnder(root, path)) return root;
    return std::nullopt;
}

fs::path LocalDriveClient::guardPath(const std::string& path) const {
    const auto root = rootOf(fs::weakly_canonical(path));
    if (!root) throw std::runtime_error("Path is not on a managed drive: " + path);

    const auto dir = *root / lockDir_;
    fs::create_directories(dir);
    return dir / ".guard";
}

fs::path LocalDriveClient::recordPath(const std::string& path) const {
    const auto abs = fs::weakly_canonical(path);
    const auto root = rootOf(abs);
    if (!root) throw std::runtime_error("Path is not on a managed drive: " + path);

    auto record = *root / lockDir_ / abs.lexically_relative(*root);
    record += ".lock.json";
    return record;
}

std::optional<model::LockInfo> LocalDriveClient::readRecord(const fs::path& record) const {
    std::ifstream in(record);
    if (!in) return std::nullopt;

    std::stringstream buffer;
    buffer << in.rdbuf();
    return nlohmann::json::parse(buffer.str()).get<model::LockInfo>();
}

void LocalDriveClient::writeRecord(const fs::path& record, const model::LockInfo& info) const {
    fs::create_directories(record.parent_path());

    auto tmp = record;
    tmp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(tmpCounter.fetch_add(1));
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to write lock record: " + tmp.string());
        out << nlohmann::json(info).dump(2);
        if (!out.flush()) throw std::runtime_error("Failed to write lock record: " + tmp.string());
    }
    try {
        fs::rename(tmp, record);
    } catch (const fs::filesystem_error&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
}

bool LocalDriveClient::contains(const std::string& path) {
    if (path.empty()) return false;
    const auto abs = fs::weakly_canonical(path);
    if (!rootOf(abs)) return false;

    // The lock records themselves are not documents
    for (const auto& part : abs)
        if (part == lockDir_) return false;

    return fs::is_regular_file(abs);
}

model::LockState LocalDriveClient::state(const std::string& path) {
    std::scoped_lock lock(mutex_);
    const auto record = readRecord(recordPath(path));
    if (!record) return model::LockState::Unlocked;
    return record->owner == owner_ ? model::LockState::LockedBySelf : model::LockState::LockedByOther;
}

bool LocalDriveClient::isLockedByOther(const std::string& path) {
    return state(path) == model::LockState::LockedByOther;
}

bool LocalDriveClient::lockFile(const std::string& path) {
    std::scoped_lock lock(mutex_);
    const auto record = recordPath(path);
    const DriveGuard guard(guardPath(path));

    if (const auto existing = readRecord(record); existing && existing->owner != owner_) {
        log::Registry::drive()->warn("[LocalDriveClient] {} is held by {}", path, existing->owner);
        return false;
    }

    writeRecord(record, {owner_, std::chrono::system_clock::now()});
    log::Registry::drive()->debug("[LocalDriveClient] Locked {} as {}", path, owner_);
    return true;
}

bool LocalDriveClient::unlockFile(const std::string& path) {
    std::scoped_lock lock(mutex_);
    const auto record = recordPath(path);
    const DriveGuard guard(guardPath(path));

    const auto existing = readRecord(record);
    if (!existing) {
        log::Registry::drive()->debug("[LocalDriveClient] No lock to release on {}", path);
        return false;
    }
    if (existing->owner != owner_) {
        log::Registry::drive()->warn("[LocalDriveClient] Refusing to release lock of {} on {}", existing->owner, path);
        return false;
    }

    return fs::remove(record);
}

void LocalDriveClient::syncFile(const std::string& path, const bool force) {
    std::scoped_lock lock(mutex_);
    const auto abs = fs::weakly_canonical(path);
    if (!rootOf(abs)) throw std::runtime_error("Path is not on a managed drive: " + path);

    util::flushToDisk(abs);

    if (force) {
        util::flushToDisk(abs.parent_path());
        if (const auto recordDir = recordPath(path).parent_path(); fs::is_directory(recordDir))
            util::flushToDisk(recordDir);
    }

    log::Registry::drive()->debug("[LocalDriveClient] Synced {}{}", path, force ? " (forced)" : "");
}

model::LockInfo LocalDriveClient::getFileInfo(const std::string& path) {
    std::scoped_lock lock(mutex_);
    auto record = readRecord(recordPath(path));
    if (!record) throw std::runtime_error("File is not locked: " + path);
    return *record;
}
