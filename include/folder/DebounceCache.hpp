#pragma once

#include "types/ids.hpp"

#include <compare>
#include <mutex>
#include <set>

namespace fl::folder {

struct DebounceKey {
    types::AccountId account_id{};
    types::FolderId folder_id{};

    auto operator<=>(const DebounceKey&) const = default;
};

// Folders that were polled at least once during the owner's lifetime. Not persisted.
class DebounceCache {
public:
    // True when key was not observed before.
    bool markObserved(const DebounceKey& key);

    [[nodiscard]] bool isObserved(const DebounceKey& key) const;

    void reset();

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::set<DebounceKey> observed_;
};

}
