#pragma once

#include "lock/model/LockInfo.hpp"

#include <string>

namespace dl::lock {

// Remote lock service for a managed (cloud-backed) drive. Every call goes to
// the backend; nothing is cached between calls. Any method may throw.
class Client {
public:
    virtual ~Client() = default;

    // True when the path belongs to a managed drive.
    [[nodiscard]] virtual bool contains(const std::string& path) = 0;

    [[nodiscard]] virtual bool isLockedByOther(const std::string& path) = 0;

    // Returns false when the lock could not be taken.
    virtual bool lockFile(const std::string& path) = 0;

    // Returns false when there was no lock of ours to release.
    virtual bool unlockFile(const std::string& path) = 0;

    // force: push immediately rather than waiting for the drive's quiet period.
    virtual void syncFile(const std::string& path, bool force) = 0;

    // Only meaningful while the file is locked.
    [[nodiscard]] virtual model::LockInfo getFileInfo(const std::string& path) = 0;
};

}
