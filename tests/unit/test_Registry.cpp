#include <gtest/gtest.h>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace dl;

namespace fs = std::filesystem;

namespace {

std::string slurp(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}

TEST(RegistryTest, UnknownLoggerThrows) {
    EXPECT_THROW((void)log::Registry::get("nope"), std::runtime_error);
}

TEST(RegistryTest, ReopenMainLogStartsAFreshFileAfterRotation) {
    const auto dir = config::ConfigRegistry::get().logging.log_dir;
    ASSERT_FALSE(dir.empty());
    const auto logPath = dir / "drivelock.log";
    const auto rotated = dir / "drivelock.log.rotated";

    log::Registry::drivelock()->warn("[RegistryTest] before rotation");
    log::Registry::drivelock()->flush();
    ASSERT_TRUE(fs::exists(logPath));

    // logrotate moves the file away without truncating it
    fs::rename(logPath, rotated);
    log::Registry::reopenMainLog();

    log::Registry::lock()->warn("[RegistryTest] after rotation");
    log::Registry::lock()->flush();

    ASSERT_TRUE(fs::exists(logPath));
    const auto fresh = slurp(logPath);
    const auto old = slurp(rotated);

    EXPECT_NE(fresh.find("after rotation"), std::string::npos);
    EXPECT_EQ(fresh.find("before rotation"), std::string::npos);
    EXPECT_NE(old.find("before rotation"), std::string::npos);
    EXPECT_EQ(old.find("after rotation"), std::string::npos);

    fs::remove(rotated);
}
