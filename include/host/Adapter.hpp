#pragma once

#include "host/DocumentEvents.hpp"

#include <functional>
#include <memory>

namespace dl::lock { struct Outcome; }

namespace dl::host {

class Listener;

// Subscribes a Listener to both host surfaces for as long as it lives.
class Adapter {
public:
    Adapter(std::shared_ptr<Listener> listener, ModelDocumentEvents& model, CompanionDocumentServer& companion);
    ~Adapter();

    Adapter(const Adapter&) = delete;
    Adapter& operator=(const Adapter&) = delete;

private:
    std::shared_ptr<Listener> listener_;
    ModelDocumentEvents& model_;
    CompanionDocumentServer& companion_;

    Event<OpenDocumentArgs>::Id openId_{};
    Event<CloseDocumentArgs>::Id closeId_{};
    Event<CompanionDocument>::Id addedId_{};
    Event<CompanionDocument>::Id removedId_{};

    void subscribeToModelChanges();
    void subscribeToCompanionChanges();

    static void report(const char* event, const lock::Outcome& outcome);
    static void runAndCaptureExceptions(const char* event, const std::function<void()>& action);
};

}
