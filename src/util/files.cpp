#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <system_error>

namespace fs = std::filesystem;
using namespace dl;

bool dl::util::setReadOnly(const fs::path& path, const bool readOnly) {
    // Only the owner bit is toggled so clearing restores the original mode
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_write,
                    readOnly ? fs::perm_options::remove : fs::perm_options::add, ec);

    if (ec) {
        log::Registry::drive()->warn("[files] Failed to {} read-only on {}: {}",
                                     readOnly ? "set" : "clear", path.string(), ec.message());
        return false;
    }

    log::Registry::drive()->debug("[files] {} read-only on {}", readOnly ? "Set" : "Cleared", path.string());
    return true;
}

bool dl::util::isReadOnly(const fs::path& path) {
    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (ec) return false;
    return (st.permissions() & fs::perms::owner_write) == fs::perms::none;
}

void dl::util::flushToDisk(const fs::path& path) {
    const int flags = fs::is_directory(path) ? O_RDONLY | O_DIRECTORY : O_RDONLY;
    const int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) throw std::system_error(errno, std::generic_category(), "open " + path.string());

    const int rc = ::fsync(fd);
    const int err = errno;
    ::close(fd);

    if (rc != 0) throw std::system_error(err, std::generic_category(), "fsync " + path.string());
}
