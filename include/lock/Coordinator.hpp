#pragma once

#include "host/Listener.hpp"
#include "config/Config.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <unordered_set>

namespace dl::concurrency { class PathSerializer; }
namespace dl::notify { class Sink; }

namespace dl::lock {

class Client;

// Turns document open/close into remote lock operations.
//
// The remote service is the only source of truth: nothing is remembered
// between the open and the close of a document. Queries and notifications
// run on the calling (host event) thread; lockFile/unlockFile/syncFile run in
// the background, serialized per path.
class Coordinator final : public host::Listener {
public:
    Coordinator(std::shared_ptr<Client> client,
                std::shared_ptr<notify::Sink> sink,
                std::shared_ptr<concurrency::PathSerializer> serializer,
                const config::PluginConfig& cfg);

    Outcome onOpen(const std::string& path, bool imported, const std::string& extension) override;
    Outcome onClose(const std::optional<std::string>& path) override;

    // Waits for background lock work scheduled so far.
    void drain() const;
    [[nodiscard]] bool drain(std::chrono::milliseconds timeout) const;

    [[nodiscard]] const std::string& pluginName() const { return name_; }

private:
    std::shared_ptr<Client> client_;
    std::shared_ptr<notify::Sink> sink_;
    std::shared_ptr<concurrency::PathSerializer> serializer_;
    std::string name_;
    bool setReadOnly_;
    std::unordered_set<std::string> lockableExtensions_;

    [[nodiscard]] bool isLockable(const std::string& extension) const;

    Outcome checkInFile(const std::string& path);
    Outcome checkOutFile(const std::string& path);

    void notifyLockedByOther(const std::string& path);

    template<typename Fn>
    Outcome runAndCaptureExceptions(const char* what, const std::string& path, Fn&& fn);
};

}
