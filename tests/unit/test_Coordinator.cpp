#include <gtest/gtest.h>

#include "lock/Coordinator.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/PathSerializer.hpp"
#include "log/Registry.hpp"
#include "helpers/FakeClient.hpp"
#include "helpers/RecordingSink.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace dl;
using namespace dl::lock;
using dl::test::FakeClient;
using dl::test::RecordingSink;

namespace fs = std::filesystem;

class CoordinatorTest : public ::testing::Test {
protected:
    const std::string path = "C:\\Docs\\model.3dm";

    std::shared_ptr<FakeClient> client = std::make_shared<FakeClient>();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    std::shared_ptr<concurrency::ThreadPool> pool = std::make_shared<concurrency::ThreadPool>(2);
    std::shared_ptr<concurrency::PathSerializer> serializer = std::make_shared<concurrency::PathSerializer>(pool);
    config::PluginConfig cfg;
    std::unique_ptr<Coordinator> coordinator;

    void SetUp() override { rebuild(); }

    void TearDown() override {
        coordinator->drain();
        pool->stop();
    }

    void rebuild() { coordinator = std::make_unique<Coordinator>(client, sink, serializer, cfg); }

    Outcome open(const std::string& p) { return coordinator->onOpen(p, false, ".3dm"); }
};

TEST_F(CoordinatorTest, OpenUntrackedFileDoesNothingRemote) {
    const auto outcome = open(path);
    coordinator->drain();

    EXPECT_EQ(outcome.status, Outcome::Status::Untracked);
    EXPECT_TRUE(client->mutations().empty());
    EXPECT_EQ(client->count("isLockedByOther"), 0u);
    EXPECT_TRUE(sink->statusLines().empty());
    EXPECT_TRUE(sink->messages().empty());
}

TEST_F(CoordinatorTest, CloseUntrackedFileDoesNothingRemote) {
    const auto outcome = coordinator->onClose(path);
    coordinator->drain();

    EXPECT_EQ(outcome.status, Outcome::Status::Untracked);
    EXPECT_TRUE(client->mutations().empty());
    EXPECT_TRUE(sink->statusLines().empty());
}

TEST_F(CoordinatorTest, OpenFreeFileLocksItOnce) {
    client->tracked.insert(path);

    const auto outcome = open(path);
    coordinator->drain();

    EXPECT_EQ(outcome.status, Outcome::Status::Locked);
    EXPECT_EQ(client->count("lockFile"), 1u);
    ASSERT_EQ(sink->statusLines().size(), 1u);
    EXPECT_EQ(sink->statusLines()[0], "Locked \"model.3dm\"");
    EXPECT_TRUE(sink->messages().empty());
}

TEST_F(CoordinatorTest, OpenLockedByOtherWarnsAndNeverLocks) {
    client->tracked.insert(path);
    client->lockedByOther.insert(path);

    const auto outcome = open(path);
    coordinator->drain();

    EXPECT_EQ(outcome.status, Outcome::Status::LockedByOther);
    EXPECT_EQ(client->count("lockFile"), 0u);
    EXPECT_TRUE(sink->statusLines().empty());

    const auto messages = sink->messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].icon, notify::Icon::Stop);
    EXPECT_EQ(messages[0].title, cfg.name);
    EXPECT_NE(messages[0].text.find("\"model.3dm\""), std::string::npos);
    EXPECT_NE(messages[0].text.find("alice"), std::string::npos);
    EXPECT_NE(messages[0].text.find("2024-01-01T00:00:00"), std::string::npos);
    EXPECT_NE(messages[0].text.find("Any edits you make may be sent to recycle bin!"), std::string::npos);
}

TEST_F(CoordinatorTest, CloseOwnLockUnlocksThenForceSyncs) {
    client->tracked.insert(path);

    const auto outcome = coordinator->onClose(path);
    coordinator->drain();

    EXPECT_EQ(outcome.status, Outcome::Status::Unlocked);
    EXPECT_EQ(client->mutations(), (std::vector<std::string>{"unlockFile", "syncFile(force)"}));
    ASSERT_EQ(sink->statusLines().size(), 1u);
    EXPECT_EQ(sink->statusLines()[0], "UnLocked \"model.3dm\"");
}

TEST_F(CoordinatorTest, CloseLockedByOtherLeavesLockAndDriveAlone) {
    client->tracked.insert(path);
    client->lockedByOther.insert(path);

    const auto outcome = coordinator->onClose(path);
    coordinator->drain();

    EXPECT_EQ(outcome.status, Outcome::Status::LockedByOther);
    EXPECT_TRUE(client->mutations().empty());
    EXPECT_TRUE(sink->statusLines().empty());
}

TEST_F(CoordinatorTest, SyncStillRunsWhenUnlockFails) {
    client->tracked.insert(path);
    client->unlockResult = false;

    EXPECT_EQ(coordinator->onClose(path).status, Outcome::Status::Unlocked);
    coordinator->drain();

    EXPECT_EQ(client->mutations(), (std::vector<std::string>{"unlockFile", "syncFile(force)"}));
}

TEST_F(CoordinatorTest, LockFailureIsNotSurfaced) {
    client->tracked.insert(path);
    client->lockResult = false;

    const auto outcome = open(path);
    coordinator->drain();

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(client->count("lockFile"), 1u);
    EXPECT_TRUE(sink->messages().empty());
}

TEST_F(CoordinatorTest, ThrowingLockTaskDoesNotReachCaller) {
    client->tracked.insert(path);
    client->throwOnLock = true;

    EXPECT_NO_THROW(open(path));
    coordinator->drain();
    EXPECT_EQ(client->count("lockFile"), 1u);
}

TEST_F(CoordinatorTest, ThrowingClientIsCaughtAndLogged) {
    client->tracked.insert(path);
    client->throwOnContains = true;

    const auto logger = log::Registry::lock();
    const auto ring = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    logger->sinks().push_back(ring);

    Outcome openOutcome, closeOutcome;
    EXPECT_NO_THROW(openOutcome = open(path));
    EXPECT_NO_THROW(closeOutcome = coordinator->onClose(path));
    coordinator->drain();

    logger->sinks().pop_back();

    EXPECT_EQ(openOutcome.status, Outcome::Status::Failed);
    EXPECT_EQ(openOutcome.reason, "lock service unreachable");
    EXPECT_FALSE(closeOutcome.ok());
    EXPECT_TRUE(client->mutations().empty());

    const auto lines = ring->last_formatted();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("lock service unreachable"), std::string::npos);
}

TEST_F(CoordinatorTest, ImportedDocumentIsSkipped) {
    client->tracked.insert(path);

    const auto outcome = coordinator->onOpen(path, true, ".3dm");

    EXPECT_EQ(outcome.status, Outcome::Status::Skipped);
    EXPECT_TRUE(client->calls().empty());
}

TEST_F(CoordinatorTest, NonNativeExtensionIsSkipped) {
    client->tracked.insert("C:\\Docs\\mesh.obj");

    const auto outcome = coordinator->onOpen("C:\\Docs\\mesh.obj", false, ".obj");

    EXPECT_EQ(outcome.status, Outcome::Status::Skipped);
    EXPECT_TRUE(client->calls().empty());
}

TEST_F(CoordinatorTest, ExtensionMatchIgnoresCase) {
    client->tracked.insert("C:\\Docs\\MODEL.3DM");

    EXPECT_EQ(coordinator->onOpen("C:\\Docs\\MODEL.3DM", false, ".3DM").status, Outcome::Status::Locked);
}

TEST_F(CoordinatorTest, CompanionDocumentsAreLockable) {
    const std::string gh = "/mnt/drive/defs/truss.gh";
    client->tracked.insert(gh);

    EXPECT_EQ(coordinator->onOpen(gh, false, ".gh").status, Outcome::Status::Locked);
    coordinator->drain();
    ASSERT_EQ(sink->statusLines().size(), 1u);
    EXPECT_EQ(sink->statusLines()[0], "Locked \"truss.gh\"");
}

TEST_F(CoordinatorTest, UnsavedDocumentCloseIsSkipped) {
    EXPECT_EQ(coordinator->onClose(std::nullopt).status, Outcome::Status::Skipped);
    EXPECT_EQ(coordinator->onClose(std::string{}).status, Outcome::Status::Skipped);
    EXPECT_TRUE(client->calls().empty());
}

TEST_F(CoordinatorTest, CloseThenReopenKeepsRemoteOrder) {
    client->tracked.insert(path);

    for (int i = 0; i < 20; ++i) {
        ASSERT_EQ(coordinator->onClose(path).status, Outcome::Status::Unlocked);
        ASSERT_EQ(open(path).status, Outcome::Status::Locked);
    }
    coordinator->drain();

    const auto ops = client->mutations();
    ASSERT_EQ(ops.size(), 60u);
    for (size_t i = 0; i < ops.size(); i += 3) {
        EXPECT_EQ(ops[i], "unlockFile");
        EXPECT_EQ(ops[i + 1], "syncFile(force)");
        EXPECT_EQ(ops[i + 2], "lockFile");
    }
}

class CoordinatorReadOnlyTest : public CoordinatorTest {
protected:
    fs::path dir;
    std::string file;

    void SetUp() override {
        dir = fs::temp_directory_path() / "drivelock_coordinator_ro";
        fs::create_directories(dir);
        file = (dir / "shared.3dm").string();
        std::ofstream(file) << "model";

        cfg.set_read_only = true;
        rebuild();
        client->tracked.insert(file);
        client->lockedByOther.insert(file);
    }

    void TearDown() override {
        CoordinatorTest::TearDown();
        fs::permissions(file, fs::perms::owner_write, fs::perm_options::add);
        fs::remove_all(dir);
    }

    bool writable() const {
        return (fs::status(file).permissions() & fs::perms::owner_write) != fs::perms::none;
    }
};

TEST_F(CoordinatorReadOnlyTest, LockedByOtherTogglesReadOnlyAcrossOpenAndClose) {
    ASSERT_TRUE(writable());

    EXPECT_EQ(open(file).status, Outcome::Status::LockedByOther);
    EXPECT_FALSE(writable());

    EXPECT_EQ(coordinator->onClose(file).status, Outcome::Status::LockedByOther);
    EXPECT_TRUE(writable());
}

TEST_F(CoordinatorReadOnlyTest, ReadOnlyIsOffByDefault) {
    cfg.set_read_only = false;
    rebuild();

    EXPECT_EQ(open(file).status, Outcome::Status::LockedByOther);
    EXPECT_TRUE(writable());
}
