#include "concurrency/CancellationToken.hpp"

using namespace fl::concurrency;

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() const {
    std::map<uint64_t, Callback> callbacks;
    {
        std::scoped_lock lock(state_->mutex);
        if (state_->cancelled) return;
        state_->cancelled = true;
        callbacks.swap(state_->callbacks);
    }
    for (auto& [id, cb] : callbacks) cb();
}

bool CancellationToken::isCancelled() const {
    std::scoped_lock lock(state_->mutex);
    return state_->cancelled;
}

uint64_t CancellationToken::onCancel(Callback cb) const {
    {
        std::scoped_lock lock(state_->mutex);
        if (!state_->cancelled) {
            const auto id = state_->nextId++;
            state_->callbacks.emplace(id, std::move(cb));
            return id;
        }
    }
    cb();
    return 0;
}

void CancellationToken::unsubscribe(const uint64_t id) const {
    if (id == 0) return;
    std::scoped_lock lock(state_->mutex);
    state_->callbacks.erase(id);
}
