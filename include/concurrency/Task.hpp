#pragma once

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace fl::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// Runs a callable and publishes its result (or exception) through a std::future.
template <typename T>
struct PromisedTask : Task {
    std::promise<T> promise;
    std::function<T()> fn;

    explicit PromisedTask(std::function<T()> f) : fn(std::move(f)) {}

    std::future<T> getFuture() { return promise.get_future(); }

    void operator()() override {
        try {
            if constexpr (std::is_void_v<T>) {
                fn();
                promise.set_value();
            } else {
                promise.set_value(fn());
            }
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }
};

}
