#include "plugin/Plugin.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/PathSerializer.hpp"
#include "host/Adapter.hpp"
#include "lock/Client.hpp"
#include "lock/Coordinator.hpp"
#include "notify/Sink.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

#include <stdexcept>

using namespace dl::plugin;
using namespace dl;

Plugin::Plugin(config::Config cfg,
               ClientFactory clientFactory,
               std::shared_ptr<notify::Sink> sink,
               host::ModelDocumentEvents& model,
               host::CompanionDocumentServer& companion)
    : config_(std::move(cfg)), clientFactory_(std::move(clientFactory)), sink_(std::move(sink)),
      model_(model), companion_(companion) {}

Plugin::~Plugin() {
    shutdown();
}

LoadReturnCode Plugin::onLoad(std::string& errorMessage) {
    if (isLoaded()) return LoadReturnCode::Success;

    try {
        if (!clientFactory_ || !sink_) throw std::invalid_argument("Plugin requires a client factory and a notification sink");

        // connect to the lock service and hold it for this session
        auto client = clientFactory_();
        if (!client) throw std::runtime_error("Lock service client factory returned nothing");

        pool_ = std::make_shared<concurrency::ThreadPool>(config_.concurrency.worker_threads);
        serializer_ = std::make_shared<concurrency::PathSerializer>(pool_);
        coordinator_ = std::make_shared<lock::Coordinator>(std::move(client), sink_, serializer_, config_.plugin);

        // start listening to both hosts' document events
        adapter_ = std::make_unique<host::Adapter>(coordinator_, model_, companion_);

        log::Registry::drivelock()->info("[Plugin] Successfully connected to the lock service");
        return LoadReturnCode::Success;
    } catch (const std::exception& e) {
        return failLoad(errorMessage, e.what());
    } catch (...) {
        return failLoad(errorMessage, "unknown error");
    }
}

LoadReturnCode Plugin::failLoad(std::string& errorMessage, const std::string& reason) {
    adapter_.reset();
    coordinator_.reset();
    serializer_.reset();
    if (pool_) pool_->stop();
    pool_.reset();

    errorMessage = reason;
    log::Registry::drivelock()->error("[Plugin] Error loading {}: {}", name(), reason);
    if (sink_) sink_->status(fmt::format("Error loading {} {}", name(), reason));
    return LoadReturnCode::ErrorNoDialog;
}

void Plugin::shutdown() {
    if (!isLoaded()) return;

    adapter_.reset();

    if (!coordinator_->drain(SHUTDOWN_DRAIN_TIMEOUT))
        log::Registry::drivelock()->warn("[Plugin] Lock work still pending after {}s, abandoning it",
                                         SHUTDOWN_DRAIN_TIMEOUT.count());

    pool_->stop();
    serializer_->abandon();
    coordinator_.reset();
    serializer_.reset();
    pool_.reset();

    log::Registry::drivelock()->info("[Plugin] Shut down");
}
