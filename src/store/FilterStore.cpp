#include "store/FilterStore.hpp"
#include "error/FolderError.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <condition_variable>
#include <fstream>
#include <stdexcept>
#include <vector>

using namespace fl::store;
using namespace fl::types;

namespace {

constexpr int SNAPSHOT_FORMAT_VERSION = 1;

}

FilterStore::Watch::Watch(std::weak_ptr<WatcherRegistry> registry, const uint64_t id, std::shared_ptr<Watcher> watcher)
    : registry_(std::move(registry)), id_(id), watcher_(std::move(watcher)) {}

FilterStore::Watch::Watch(Watch&& other) noexcept
    : registry_(std::move(other.registry_)), id_(other.id_), watcher_(std::move(other.watcher_)) {
    other.id_ = 0;
}

FilterStore::Watch& FilterStore::Watch::operator=(Watch&& other) noexcept {
    if (this != &other) {
        cancel();
        registry_ = std::move(other.registry_);
        id_ = other.id_;
        watcher_ = std::move(other.watcher_);
        other.id_ = 0;
    }
    return *this;
}

FilterStore::Watch::~Watch() { cancel(); }

void FilterStore::Watch::cancel() {
    if (!watcher_) return;
    {
        std::scoped_lock lock(watcher_->mutex);
        watcher_->active = false;
    }
    if (const auto registry = registry_.lock()) {
        std::scoped_lock lock(registry->mutex);
        registry->watchers.erase(id_);
    }
    watcher_.reset();
    id_ = 0;
}

bool FilterStore::Watch::isActive() const {
    if (!watcher_) return false;
    std::scoped_lock lock(watcher_->mutex);
    return watcher_->active;
}

FilterStore::FilterStore()
    : snapshot_(std::make_shared<const FilterState>()),
      registry_(std::make_shared<WatcherRegistry>()) {}

void FilterStore::guarded(const std::string& ctx, Transaction& txn, const std::function<void()>& body) {
    log::Registry::store()->trace("[FilterStore::exec] Starting transaction: {}", ctx);
    try {
        body();
    } catch (...) {
        log::Registry::store()->warn("[FilterStore::exec] Exception in transaction context '{}', rolling back", ctx);
        txn.rollback();
        throw;
    }
}

std::optional<FilterStore::Published> FilterStore::commit(const std::string& ctx, Transaction& txn) {
    std::optional<Published> published;

    if (txn.touchedFilterState()) {
        const auto* before = txn.filterStateBefore();
        if (!before || *before != data_.filters) {
            snapshot_ = std::make_shared<const FilterState>(data_.filters);
            published = Published{snapshot_, ++version_};
        }
    }

    txn.release();
    log::Registry::store()->trace("[FilterStore::exec] Transaction committed: {}", ctx);
    return published;
}

void FilterStore::publish(const Published& published) {
    std::vector<std::shared_ptr<Watcher>> watchers;
    {
        std::scoped_lock lock(registry_->mutex);
        watchers.reserve(registry_->watchers.size());
        for (const auto& [id, w] : registry_->watchers) watchers.push_back(w);
    }

    for (const auto& w : watchers) deliver(w, published);
}

void FilterStore::deliver(const std::shared_ptr<Watcher>& watcher, const Published& published) {
    std::scoped_lock lock(watcher->mutex);
    if (!watcher->active) return;
    try {
        watcher->cb(published.snapshot, published.version);
    } catch (const std::exception& e) {
        log::Registry::store()->error("[FilterStore] Watcher failed on version {}: {}", published.version, e.what());
    }
}

std::pair<FilterStore::Snapshot, uint64_t> FilterStore::current() const {
    std::scoped_lock lock(mutex_);
    return {snapshot_, version_};
}

FilterStore::Watch FilterStore::watch(WatchCallback cb, const bool emitCurrent) {
    auto watcher = std::make_shared<Watcher>();
    watcher->cb = std::move(cb);

    uint64_t id = 0;
    {
        std::scoped_lock lock(registry_->mutex);
        id = registry_->nextId++;
        registry_->watchers.emplace(id, watcher);
    }

    // Registered before reading the current state, so no commit can fall in between.
    if (emitCurrent) {
        const auto [snapshot, version] = current();
        deliver(watcher, Published{snapshot, version});
    }

    return Watch(registry_, id, watcher);
}

bool FilterStore::waitUntil(const std::function<bool(const FilterState&)>& predicate,
                            const std::chrono::milliseconds timeout,
                            const concurrency::CancellationToken& token) {
    struct Waiter {
        std::mutex mutex;
        std::condition_variable cv;
        bool satisfied{false};
        bool cancelled{false};
    };

    const auto waiter = std::make_shared<Waiter>();

    auto watch = this->watch([waiter, &predicate](const Snapshot& snapshot, uint64_t) {
        if (!predicate(*snapshot)) return;
        {
            std::scoped_lock lock(waiter->mutex);
            waiter->satisfied = true;
        }
        waiter->cv.notify_all();
    });

    const auto cancelId = token.onCancel([waiter] {
        {
            std::scoped_lock lock(waiter->mutex);
            waiter->cancelled = true;
        }
        waiter->cv.notify_all();
    });

    bool satisfied = false, cancelled = false;
    {
        std::unique_lock lock(waiter->mutex);
        waiter->cv.wait_for(lock, timeout, [&] { return waiter->satisfied || waiter->cancelled; });
        satisfied = waiter->satisfied;
        cancelled = waiter->cancelled;
    }

    token.unsubscribe(cancelId);
    watch.cancel();

    if (satisfied) return true;
    if (cancelled) throw error::CancelledError("Wait for local state cancelled");
    return false;
}

void FilterStore::save(const std::filesystem::path& path) {
    nlohmann::json j;
    {
        std::scoped_lock lock(mutex_);

        auto peers = nlohmann::json::array();
        for (const auto& [id, peer] : data_.peers) peers.push_back(peer);

        auto presences = nlohmann::json::array();
        for (const auto& [id, presence] : data_.presences) presences.push_back(presence);

        std::vector<EntityId> chatList(data_.chat_list.begin(), data_.chat_list.end());
        std::ranges::sort(chatList);

        j = {
            {"format", SNAPSHOT_FORMAT_VERSION},
            {"filter_state", data_.filters},
            {"peers", peers},
            {"presences", presences},
            {"chat_list", chatList},
            {"app_config", data_.app_config}
        };
    }

    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    const auto tmp = path.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) throw std::runtime_error("Failed to open store snapshot for writing: " + tmp);
        out << j.dump(2);
        if (!out) throw std::runtime_error("Failed to write store snapshot: " + tmp);
    }
    std::filesystem::rename(tmp, path);

    log::Registry::store()->debug("[FilterStore] Snapshot saved to {}", path.string());
}

void FilterStore::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Failed to open store snapshot: " + path.string());

    const auto j = nlohmann::json::parse(in);
    if (j.value("format", 0) != SNAPSHOT_FORMAT_VERSION)
        throw std::runtime_error("Unsupported store snapshot format in " + path.string());

    StoreData loaded;
    loaded.filters = j.at("filter_state").get<FilterState>();
    for (const auto& p : j.value("peers", nlohmann::json::array())) {
        auto peer = p.get<Peer>();
        loaded.peers.insert_or_assign(peer.id, std::move(peer));
    }
    for (const auto& p : j.value("presences", nlohmann::json::array())) {
        auto presence = p.get<Presence>();
        loaded.presences.insert_or_assign(presence.id, presence);
    }
    for (const auto& id : j.value("chat_list", nlohmann::json::array())) loaded.chat_list.insert(id.get<EntityId>());
    loaded.app_config = j.value("app_config", nlohmann::json::object());

    const auto peerCount = loaded.peers.size();
    Published published;
    {
        std::scoped_lock lock(mutex_);
        data_ = std::move(loaded);
        snapshot_ = std::make_shared<const FilterState>(data_.filters);
        published = Published{snapshot_, ++version_};
    }
    publish(published);

    log::Registry::store()->info("[FilterStore] Snapshot loaded from {} ({} filters, {} peers)",
                                 path.string(), published.snapshot->filters.size(), peerCount);
}
