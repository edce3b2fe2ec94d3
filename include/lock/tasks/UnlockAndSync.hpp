#pragma once

#include "concurrency/Task.hpp"

#include <memory>
#include <string>

namespace dl::lock {
class Client;
}

namespace dl::lock::tasks {

// Releases our lock, then force-syncs so the drive uploads the saved file
// right away. The sync runs even when the unlock reports failure.
struct UnlockAndSync final : concurrency::Task {
    std::shared_ptr<Client> client;
    std::string path;

    UnlockAndSync(std::shared_ptr<Client> client, std::string path);

    void operator()() override;
};

}
