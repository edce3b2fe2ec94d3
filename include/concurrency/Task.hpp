#pragma once

#include <functional>
#include <memory>
#include <utility>

namespace dl::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// Adapts a callable for the places that don't warrant a named task type.
struct FunctionTask final : Task {
    std::function<void()> fn;

    explicit FunctionTask(std::function<void()> f) : fn(std::move(f)) {}

    void operator()() override { if (fn) fn(); }
};

}
