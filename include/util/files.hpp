#pragma once

#include <filesystem>

namespace dl::util {

// Toggles the owner write bit of a local file. Returns false (and logs) when the
// attribute could not be changed; never throws.
bool setReadOnly(const std::filesystem::path& path, bool readOnly);

[[nodiscard]] bool isReadOnly(const std::filesystem::path& path);

// fsync on a file or directory; throws std::system_error on failure.
void flushToDisk(const std::filesystem::path& path);

}
