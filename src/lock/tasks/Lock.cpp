#include "lock/tasks/Lock.hpp"
#include "lock/Client.hpp"
#include "log/Registry.hpp"

using namespace dl::lock::tasks;
using namespace dl;

Lock::Lock(std::shared_ptr<Client> client, std::string path)
    : client(std::move(client)), path(std::move(path)) {}

void Lock::operator()() {
    try {
        log::Registry::lock()->info("[LockTask] Locking {}", path);
        if (!client->lockFile(path))
            log::Registry::lock()->warn("[LockTask] Failed locking {}", path);
    } catch (const std::exception& e) {
        log::Registry::lock()->error("[LockTask] Failed locking {} - {}", path, e.what());
    }
}
