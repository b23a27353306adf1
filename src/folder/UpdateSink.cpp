#include "folder/UpdateSink.hpp"
#include "folder/helpers.hpp"
#include "store/FilterStore.hpp"
#include "log/Registry.hpp"

#include <variant>

using namespace fl::folder;

StoreUpdateSink::StoreUpdateSink(std::shared_ptr<store::FilterStore> store) : store_(std::move(store)) {}

void StoreUpdateSink::apply(const net::Updates& updates) {
    store_->exec("StoreUpdateSink::apply", [&](store::Transaction& txn) {
        mergePeerBundle(txn, updates.bundle);

        for (const auto& update : updates.updates) {
            if (const auto* filterUpdate = std::get_if<net::FilterUpdate>(&update)) {
                if (filterUpdate->filter) txn.upsertFilter(*filterUpdate->filter);
                else txn.removeFilter(filterUpdate->id);
            } else if (const auto* chatUpdate = std::get_if<net::ChatListUpdate>(&update)) {
                txn.setChatListPresence(chatUpdate->id, chatUpdate->present);
            }
        }
    });

    log::Registry::updates()->trace("[StoreUpdateSink] Applied {} updates", updates.updates.size());
}
