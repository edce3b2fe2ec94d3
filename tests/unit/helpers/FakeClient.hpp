#pragma once

#include "lock/Client.hpp"

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace dl::test {

// Scriptable lock service that records every call in order.
class FakeClient final : public lock::Client {
public:
    std::unordered_set<std::string> tracked;
    std::unordered_set<std::string> lockedByOther;
    lock::model::LockInfo info{"alice", std::chrono::system_clock::from_time_t(1704067200)}; // 2024-01-01T00:00:00Z
    bool lockResult = true;
    bool unlockResult = true;
    bool throwOnContains = false;
    bool throwOnLock = false;

    bool contains(const std::string& path) override {
        record("contains", path);
        if (throwOnContains) throw std::runtime_error("lock service unreachable");
        return tracked.contains(path);
    }

    bool isLockedByOther(const std::string& path) override {
        record("isLockedByOther", path);
        return lockedByOther.contains(path);
    }

    bool lockFile(const std::string& path) override {
        record("lockFile", path);
        if (throwOnLock) throw std::runtime_error("lock rejected");
        return lockResult;
    }

    bool unlockFile(const std::string& path) override {
        record("unlockFile", path);
        return unlockResult;
    }

    void syncFile(const std::string& path, const bool force) override {
        record(force ? "syncFile(force)" : "syncFile", path);
    }

    lock::model::LockInfo getFileInfo(const std::string& path) override {
        record("getFileInfo", path);
        return info;
    }

    struct Call {
        std::string op;
        std::string path;
    };

    std::vector<Call> calls() const {
        std::scoped_lock lock(mutex_);
        return calls_;
    }

    size_t count(const std::string& op) const {
        std::scoped_lock lock(mutex_);
        size_t n = 0;
        for (const auto& c : calls_) if (c.op == op) ++n;
        return n;
    }

    // Only the calls that change remote state, in order.
    std::vector<std::string> mutations() const {
        std::scoped_lock lock(mutex_);
        std::vector<std::string> out;
        for (const auto& c : calls_)
            if (c.op == "lockFile" || c.op == "unlockFile" || c.op.starts_with("syncFile")) out.push_back(c.op);
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Call> calls_;

    void record(std::string op, const std::string& path) {
        std::scoped_lock lock(mutex_);
        calls_.push_back({std::move(op), path});
    }
};

}
