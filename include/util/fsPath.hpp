#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace dl::util {

// Host paths arrive in the host's native form. A document opened on a Windows
// host still has to resolve to "model.3dm" here, so both separators count.
inline std::string_view fileName(std::string_view path) {
    const auto pos = path.find_last_of("/\\");
    if (pos == std::string_view::npos) return path;
    return path.substr(pos + 1);
}

// Includes the leading dot; empty when the name has none or is a dotfile.
inline std::string_view extension(std::string_view path) {
    const auto name = fileName(path);
    const auto pos = name.find_last_of('.');
    if (pos == std::string_view::npos || pos == 0) return {};
    return name.substr(pos);
}

std::string toLower(std::string_view s);

inline std::filesystem::path common_path_prefix(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::filesystem::path result;
    auto ait = a.begin();
    auto bit = b.begin();

    while (ait != a.end() && bit != b.end() && *ait == *bit) {
        result /= *ait;
        ++ait;
        ++bit;
    }

    return result;
}

// Lexical containment, both sides normalized first.
bool isUnder(const std::filesystem::path& root, const std::filesystem::path& path);

}
