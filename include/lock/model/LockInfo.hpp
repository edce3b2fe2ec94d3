#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace dl::lock::model {

enum class LockState { Unlocked, LockedBySelf, LockedByOther };

struct LockInfo {
    std::string owner;
    std::chrono::system_clock::time_point lockTimestamp;

    LockInfo() = default;
    LockInfo(std::string owner, std::chrono::system_clock::time_point ts)
        : owner(std::move(owner)), lockTimestamp(ts) {}

    bool operator==(const LockInfo&) const = default;
};

void to_json(nlohmann::json& j, const LockInfo& info);
void from_json(const nlohmann::json& j, LockInfo& info);

}
