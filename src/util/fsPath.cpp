#include "util/fsPath.hpp"

#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

std::string dl::util::toLower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool dl::util::isUnder(const fs::path& root, const fs::path& path) {
    const auto normRoot = root.lexically_normal();
    const auto normPath = path.lexically_normal();
    if (normRoot.empty() || normPath == normRoot) return false;

    auto prefix = common_path_prefix(normRoot, normPath);
    // lexically_normal keeps a trailing separator as an empty element
    if (normRoot.filename().empty()) prefix /= "";
    return prefix == normRoot;
}
