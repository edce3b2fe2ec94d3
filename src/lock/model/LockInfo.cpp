#include "lock/model/LockInfo.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace dl::lock::model;

void dl::lock::model::to_json(nlohmann::json& j, const LockInfo& info) {
    j = {
        {"owner", info.owner},
        {"locked_at", util::timestampToString(info.lockTimestamp)}
    };
}

void dl::lock::model::from_json(const nlohmann::json& j, LockInfo& info) {
    info.owner = j.at("owner").get<std::string>();
    info.lockTimestamp = util::parseTimePoint(j.at("locked_at").get<std::string>());
}
