#pragma once

#include <string>
#include <string_view>

namespace dl::notify::messages {

std::string locked(std::string_view fileName);

std::string unlocked(std::string_view fileName);

std::string lockedByOther(std::string_view fileName, std::string_view owner, std::string_view lockTime);

}
