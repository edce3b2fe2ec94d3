#pragma once

#include <string>

namespace dl::lock {

// What a lifecycle handler did with one event. Failures are reported here
// instead of escaping into the host's event dispatch.
struct Outcome {
    enum class Status { Skipped, Untracked, Locked, LockedByOther, Unlocked, Failed };

    Status status = Status::Skipped;
    std::string reason;

    [[nodiscard]] bool ok() const { return status != Status::Failed; }

    static Outcome of(const Status s) { return {s, {}}; }
    static Outcome skipped(std::string why) { return {Status::Skipped, std::move(why)}; }
    static Outcome failure(std::string why) { return {Status::Failed, std::move(why)}; }
};

std::string to_string(Outcome::Status status);

}
