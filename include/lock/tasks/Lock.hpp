#pragma once

#include "concurrency/Task.hpp"

#include <memory>
#include <string>

namespace dl::lock {
class Client;
}

namespace dl::lock::tasks {

struct Lock final : concurrency::Task {
    std::shared_ptr<Client> client;
    std::string path;

    Lock(std::shared_ptr<Client> client, std::string path);

    void operator()() override;
};

}
