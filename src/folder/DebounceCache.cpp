#include "folder/DebounceCache.hpp"

using namespace fl::folder;

bool DebounceCache::markObserved(const DebounceKey& key) {
    std::scoped_lock lock(mutex_);
    return observed_.insert(key).second;
}

bool DebounceCache::isObserved(const DebounceKey& key) const {
    std::scoped_lock lock(mutex_);
    return observed_.contains(key);
}

void DebounceCache::reset() {
    std::scoped_lock lock(mutex_);
    observed_.clear();
}

size_t DebounceCache::size() const {
    std::scoped_lock lock(mutex_);
    return observed_.size();
}
