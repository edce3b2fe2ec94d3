#include "lock/Coordinator.hpp"
#include "lock/Client.hpp"
#include "lock/tasks/Lock.hpp"
#include "lock/tasks/UnlockAndSync.hpp"
#include "concurrency/PathSerializer.hpp"
#include "notify/Sink.hpp"
#include "notify/messages.hpp"
#include "util/files.hpp"
#include "util/fsPath.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace dl::lock;
using namespace dl;

Coordinator::Coordinator(std::shared_ptr<Client> client,
                         std::shared_ptr<notify::Sink> sink,
                         std::shared_ptr<concurrency::PathSerializer> serializer,
                         const config::PluginConfig& cfg)
    : client_(std::move(client)), sink_(std::move(sink)), serializer_(std::move(serializer)),
      name_(cfg.name), setReadOnly_(cfg.set_read_only) {
    if (!client_ || !sink_ || !serializer_)
        throw std::invalid_argument("Coordinator requires a client, a notification sink and a serializer");

    for (const auto& ext : cfg.lockable_extensions) lockableExtensions_.insert(util::toLower(ext));
}

bool Coordinator::isLockable(const std::string& extension) const {
    return lockableExtensions_.contains(util::toLower(extension));
}

template<typename Fn>
Outcome Coordinator::runAndCaptureExceptions(const char* what, const std::string& path, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        log::Registry::lock()->error("[Coordinator] {} {} failed: {}", what, path, e.what());
        return Outcome::failure(e.what());
    } catch (...) {
        log::Registry::lock()->error("[Coordinator] {} {} failed: unknown exception", what, path);
        return Outcome::failure("unknown exception");
    }
}

Outcome Coordinator::onOpen(const std::string& path, const bool imported, const std::string& extension) {
    if (path.empty()) return Outcome::skipped("no file path");
    if (imported) {
        log::Registry::lock()->debug("[Coordinator] Ignoring import of {}", path);
        return Outcome::skipped("imported");
    }
    if (!isLockable(extension)) {
        log::Registry::lock()->debug("[Coordinator] Ignoring {} ({} is not lockable)", path, extension);
        return Outcome::skipped("extension");
    }

    return runAndCaptureExceptions("Opening", path, [&] { return checkInFile(path); });
}

Outcome Coordinator::onClose(const std::optional<std::string>& path) {
    if (!path || path->empty()) return Outcome::skipped("document was never saved");
    return runAndCaptureExceptions("Closing", *path, [&] { return checkOutFile(*path); });
}

Outcome Coordinator::checkInFile(const std::string& path) {
    if (!client_->contains(path)) {
        log::Registry::lock()->debug("[Coordinator] File is not on managed drive {}", path);
        return Outcome::of(Outcome::Status::Untracked);
    }

    if (client_->isLockedByOther(path)) {
        notifyLockedByOther(path);
        return Outcome::of(Outcome::Status::LockedByOther);
    }

    serializer_->submit(path, std::make_shared<tasks::Lock>(client_, path));
    sink_->status(notify::messages::locked(util::fileName(path)));
    return Outcome::of(Outcome::Status::Locked);
}

Outcome Coordinator::checkOutFile(const std::string& path) {
    if (!client_->contains(path)) {
        log::Registry::lock()->debug("[Coordinator] File is not on managed drive {}", path);
        return Outcome::of(Outcome::Status::Untracked);
    }

    if (client_->isLockedByOther(path)) {
        // Never ours: leave the lock and the drive alone
        if (setReadOnly_) util::setReadOnly(path, false);
        return Outcome::of(Outcome::Status::LockedByOther);
    }

    serializer_->submit(path, std::make_shared<tasks::UnlockAndSync>(client_, path));
    sink_->status(notify::messages::unlocked(util::fileName(path)));
    return Outcome::of(Outcome::Status::Unlocked);
}

void Coordinator::notifyLockedByOther(const std::string& path) {
    const auto info = client_->getFileInfo(path);
    const auto lockTime = util::timestampToString(info.lockTimestamp);

    if (setReadOnly_) util::setReadOnly(path, true);

    log::Registry::lock()->info("[Coordinator] File is already locked by {} @ {} {}", info.owner, lockTime, path);
    sink_->showMessage(notify::messages::lockedByOther(util::fileName(path), info.owner, lockTime),
                       name_, notify::Icon::Stop);
}

void Coordinator::drain() const {
    serializer_->waitIdle();
}

bool Coordinator::drain(const std::chrono::milliseconds timeout) const {
    return serializer_->waitIdle(timeout);
}
