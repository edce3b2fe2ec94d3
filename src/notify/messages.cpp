#include "notify/messages.hpp"

#include <fmt/format.h>

namespace dl::notify::messages {

std::string locked(const std::string_view fileName) {
    return fmt::format("Locked \"{}\"", fileName);
}

std::string unlocked(const std::string_view fileName) {
    return fmt::format("UnLocked \"{}\"", fileName);
}

std::string lockedByOther(const std::string_view fileName, const std::string_view owner, const std::string_view lockTime) {
    return fmt::format("File is locked!\n\n"
                       "\"{}\" was locked by:\n\n"
                       "Lock Owner:  {}\n"
                       "Lock Time:   {}\n\n"
                       "Any edits you make may be sent to recycle bin!",
                       fileName, owner, lockTime);
}

}
