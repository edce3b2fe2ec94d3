#pragma once

#include "lock/Client.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <mutex>
#include <optional>

namespace dl::lock {

// Lock service backed by record files on the managed drive itself. Every
// session that mounts the drive sees the same records, which is what makes a
// lock visible to other owners.
class LocalDriveClient final : public Client {
public:
    explicit LocalDriveClient(const config::DriveConfig& cfg);

    bool contains(const std::string& path) override;
    bool isLockedByOther(const std::string& path) override;
    bool lockFile(const std::string& path) override;
    bool unlockFile(const std::string& path) override;
    void syncFile(const std::string& path, bool force) override;
    model::LockInfo getFileInfo(const std::string& path) override;

    [[nodiscard]] model::LockState state(const std::string& path);

    [[nodiscard]] const std::string& owner() const { return owner_; }

    // Throws if the path is not under a managed root.
    [[nodiscard]] std::filesystem::path recordPath(const std::string& path) const;

private:
    std::vector<std::filesystem::path> roots_;
    std::string lockDir_;
    std::string owner_;
    mutable std::mutex mutex_;

    [[nodiscard]] std::optional<std::filesystem::path> rootOf(const std::filesystem::path& path) const;
    [[nodiscard]] std::filesystem::path guardPath(const std::string& path) const;
    [[nodiscard]] std::optional<model::LockInfo> readRecord(const std::filesystem::path& record) const;
    void writeRecord(const std::filesystem::path& record, const model::LockInfo& info) const;

    static std::string resolveOwner(const std::string& configured);
};

}
