#pragma once

#include "config/Config.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace dl::concurrency { class ThreadPool; class PathSerializer; }
namespace dl::host { class Adapter; struct ModelDocumentEvents; struct CompanionDocumentServer; }
namespace dl::lock { class Client; class Coordinator; }
namespace dl::notify { class Sink; }

namespace dl::plugin {

enum class LoadReturnCode { Success, ErrorShowDialog, ErrorNoDialog };

// Connecting to the lock service may throw; that fails the load.
using ClientFactory = std::function<std::shared_ptr<lock::Client>()>;

class Plugin {
public:
    Plugin(config::Config cfg,
           ClientFactory clientFactory,
           std::shared_ptr<notify::Sink> sink,
           host::ModelDocumentEvents& model,
           host::CompanionDocumentServer& companion);

    ~Plugin();

    Plugin(const Plugin&) = delete;
    Plugin& operator=(const Plugin&) = delete;

    LoadReturnCode onLoad(std::string& errorMessage);

    // Stops listening, then waits (bounded) for outstanding unlock/sync work.
    void shutdown();

    [[nodiscard]] bool isLoaded() const { return adapter_ != nullptr; }

    [[nodiscard]] const std::string& name() const { return config_.plugin.name; }

    [[nodiscard]] std::shared_ptr<lock::Coordinator> coordinator() const { return coordinator_; }

    static constexpr auto SHUTDOWN_DRAIN_TIMEOUT = std::chrono::seconds(10);

private:
    config::Config config_;
    ClientFactory clientFactory_;
    std::shared_ptr<notify::Sink> sink_;
    host::ModelDocumentEvents& model_;
    host::CompanionDocumentServer& companion_;

    std::shared_ptr<concurrency::ThreadPool> pool_;
    std::shared_ptr<concurrency::PathSerializer> serializer_;
    std::shared_ptr<lock::Coordinator> coordinator_;
    std::unique_ptr<host::Adapter> adapter_;

    LoadReturnCode failLoad(std::string& errorMessage, const std::string& reason);
};

}
