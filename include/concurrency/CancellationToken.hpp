#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace fl::concurrency {

// Copyable handle to shared cancellation state. A default constructed token is never cancelled
// unless cancel() is called on it or one of its copies.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken();

    void cancel() const;

    [[nodiscard]] bool isCancelled() const;

    // Registers a callback invoked once on cancellation (immediately if already cancelled).
    // Returns an id for unsubscribe().
    uint64_t onCancel(Callback cb) const;

    void unsubscribe(uint64_t id) const;

private:
    struct State {
        mutable std::mutex mutex;
        bool cancelled{false};
        uint64_t nextId{1};
        std::map<uint64_t, Callback> callbacks;
    };

    std::shared_ptr<State> state_;
};

}
