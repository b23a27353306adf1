#pragma once

#include "types/ids.hpp"

#include <functional>
#include <memory>

namespace fl::store { class FilterStore; }
namespace fl::net { class FolderInviteApi; }
namespace fl::concurrency { class ThreadPool; }

namespace fl::folder {

class UpdateSink;

// Collaborators every folder operation of one account works against.
struct Account {
    types::AccountId id{};
    std::shared_ptr<store::FilterStore> store;
    std::shared_ptr<net::FolderInviteApi> api;
    std::shared_ptr<UpdateSink> updates;
    std::shared_ptr<concurrency::ThreadPool> pool;
    std::function<bool()> isPremium;

    [[nodiscard]] bool premium() const { return isPremium && isPremium(); }
};

}
