#include "lock/tasks/UnlockAndSync.hpp"
#include "lock/Client.hpp"
#include "log/Registry.hpp"

using namespace dl::lock::tasks;
using namespace dl;

UnlockAndSync::UnlockAndSync(std::shared_ptr<Client> client, std::string path)
    : client(std::move(client)), path(std::move(path)) {}

void UnlockAndSync::operator()() {
    try {
        log::Registry::lock()->info("[UnlockTask] Unlocking {}", path);
        if (!client->unlockFile(path))
            log::Registry::lock()->warn("[UnlockTask] Failed unlocking {}", path);
    } catch (const std::exception& e) {
        log::Registry::lock()->error("[UnlockTask] Failed unlocking {} - {}", path, e.what());
    }

    try {
        log::Registry::lock()->info("[UnlockTask] Syncing {}", path);
        client->syncFile(path, true);
    } catch (const std::exception& e) {
        log::Registry::lock()->error("[UnlockTask] Failed syncing {} - {}", path, e.what());
    }
}
