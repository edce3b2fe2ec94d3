#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace dl::host {

// Multicast host event. Handlers run on the raising thread, in subscription order.
template<typename Args>
class Event {
public:
    using Handler = std::function<void(const Args&)>;
    using Id = uint64_t;

    Id subscribe(Handler handler) {
        std::scoped_lock lock(mutex_);
        const auto id = nextId_++;
        handlers_.emplace(id, std::move(handler));
        return id;
    }

    bool unsubscribe(const Id id) {
        std::scoped_lock lock(mutex_);
        return handlers_.erase(id) > 0;
    }

    // Handlers may (un)subscribe while being called.
    void raise(const Args& args) const {
        std::vector<Handler> snapshot;
        {
            std::scoped_lock lock(mutex_);
            snapshot.reserve(handlers_.size());
            for (const auto& [id, h] : handlers_) snapshot.push_back(h);
        }
        for (const auto& h : snapshot) h(args);
    }

    [[nodiscard]] size_t subscriberCount() const {
        std::scoped_lock lock(mutex_);
        return handlers_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<Id, Handler> handlers_;
    Id nextId_ = 1;
};

}
