#include "host/Adapter.hpp"
#include "host/Listener.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace dl::host;
using namespace dl;

Adapter::Adapter(std::shared_ptr<Listener> listener, ModelDocumentEvents& model, CompanionDocumentServer& companion)
    : listener_(std::move(listener)), model_(model), companion_(companion) {
    if (!listener_) throw std::invalid_argument("Adapter requires a listener");
    subscribeToModelChanges();
    subscribeToCompanionChanges();
}

Adapter::~Adapter() {
    model_.endOpenDocument.unsubscribe(openId_);
    model_.closeDocument.unsubscribe(closeId_);
    companion_.documentAdded.unsubscribe(addedId_);
    companion_.documentRemoved.unsubscribe(removedId_);
}

void Adapter::subscribeToModelChanges() {
    openId_ = model_.endOpenDocument.subscribe([this](const OpenDocumentArgs& e) {
        runAndCaptureExceptions("endOpenDocument", [&] {
            const std::string ext(util::extension(e.fileName));
            report("endOpenDocument", listener_->onOpen(e.fileName, e.merge || e.reference, ext));
        });
    });

    closeId_ = model_.closeDocument.subscribe([this](const CloseDocumentArgs& e) {
        runAndCaptureExceptions("closeDocument", [&] { report("closeDocument", listener_->onClose(e.path)); });
    });
}

void Adapter::subscribeToCompanionChanges() {
    addedId_ = companion_.documentAdded.subscribe([this](const CompanionDocument& doc) {
        runAndCaptureExceptions("documentAdded", [&] {
            if (!doc.filePath) return;
            const std::string ext(util::extension(*doc.filePath));
            report("documentAdded", listener_->onOpen(*doc.filePath, false, ext));
        });
    });

    removedId_ = companion_.documentRemoved.subscribe([this](const CompanionDocument& doc) {
        runAndCaptureExceptions("documentRemoved", [&] {
            if (doc.filePath) report("documentRemoved", listener_->onClose(doc.filePath));
        });
    });
}

void Adapter::report(const char* event, const lock::Outcome& outcome) {
    if (outcome.ok()) log::Registry::host()->debug("[Adapter] {} -> {}", event, lock::to_string(outcome.status));
    else log::Registry::host()->warn("[Adapter] {} failed: {}", event, outcome.reason);
}

void Adapter::runAndCaptureExceptions(const char* event, const std::function<void()>& action) {
    try {
        action();
    } catch (const std::exception& e) {
        log::Registry::host()->error("[Adapter] {} handler threw: {}", event, e.what());
    } catch (...) {
        log::Registry::host()->error("[Adapter] {} handler threw: unknown exception", event);
    }
}
