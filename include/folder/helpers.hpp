#pragma once

#include "folder/Account.hpp"
#include "error/FolderError.hpp"
#include "net/Payloads.hpp"
#include "net/RpcError.hpp"
#include "types/LimitsTable.hpp"
#include "log/Registry.hpp"

#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <vector>
#include <spdlog/logger.h>

namespace fl::store { class Transaction; }

namespace fl::folder {

// Which remote call failed; decides which quota codes are recognized.
enum class QuotaScope : uint8_t {
    None,           // any failure is generic
    Export,
    Join,
    JoinUpdates
};

// Users and channels are only addressable with an access hash.
std::optional<net::InputPeer> toInputPeer(const types::Peer& peer);

// Cached, addressable peers among ids, in the order given. Others are skipped.
std::vector<net::InputPeer> resolveInputPeers(const store::Transaction& txn, const std::vector<types::EntityId>& ids);

// Upserts the bundle's peers and presences; returns channel member counts.
std::map<types::EntityId, int32_t> mergePeerBundle(store::Transaction& txn, const net::PeerBundle& bundle);

std::optional<error::QuotaExceededError::Kind> quotaKindFor(std::string_view code, QuotaScope scope);

error::QuotaExceededError makeQuotaError(error::QuotaExceededError::Kind kind, const types::TierLimits& limits);

types::TierLimits currentLimits(const Account& account);

[[noreturn]] void throwTranslated(const Account& account, const net::RpcError& e, QuotaScope scope,
                                  std::string_view ctx, const std::shared_ptr<spdlog::logger>& logger);

// Waits for a remote call and translates its failure into the folder error taxonomy.
template <typename T>
T awaitRemote(const Account& account, std::future<T> future, const QuotaScope scope, const std::string_view ctx,
              const std::shared_ptr<spdlog::logger>& logger) {
    try {
        if constexpr (std::is_void_v<T>) future.get();
        else return future.get();
    } catch (const net::RpcError& e) {
        throwTranslated(account, e, scope, ctx, logger);
    } catch (const std::exception& e) {
        log::Registry::net()->debug("[{}] Remote call failed: {}", ctx, e.what());
        throw error::FolderError();
    }
}

}
