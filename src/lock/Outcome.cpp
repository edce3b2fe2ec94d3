#include "lock/Outcome.hpp"

std::string dl::lock::to_string(const Outcome::Status status) {
    switch (status) {
        case Outcome::Status::Skipped: return "skipped";
        case Outcome::Status::Untracked: return "untracked";
        case Outcome::Status::Locked: return "locked";
        case Outcome::Status::LockedByOther: return "locked_by_other";
        case Outcome::Status::Unlocked: return "unlocked";
        case Outcome::Status::Failed: return "failed";
    }
    return "unknown";
}
