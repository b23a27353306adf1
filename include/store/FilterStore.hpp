#pragma once

#include "store/Transaction.hpp"
#include "concurrency/CancellationToken.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace fl::store {

// In-process transactional cache of folders, pending updates and peers.
// Transactions are serialized; filter state changes are published to watchers after commit,
// outside the store lock, tagged with a strictly increasing version.
class FilterStore {
public:
    using Snapshot = std::shared_ptr<const FilterState>;
    using WatchCallback = std::function<void(const Snapshot&, uint64_t version)>;

private:
    struct Watcher {
        std::recursive_mutex mutex;
        bool active{true};
        WatchCallback cb;
    };

    struct WatcherRegistry {
        std::mutex mutex;
        std::map<uint64_t, std::shared_ptr<Watcher>> watchers;
        uint64_t nextId{1};
    };

public:
    // Keeps a watcher registered while alive. Destroying or cancelling it waits for an
    // in-flight callback of this watcher to return.
    class Watch {
    public:
        Watch() = default;
        Watch(std::weak_ptr<WatcherRegistry> registry, uint64_t id, std::shared_ptr<Watcher> watcher);
        Watch(Watch&& other) noexcept;
        Watch& operator=(Watch&& other) noexcept;
        Watch(const Watch&) = delete;
        Watch& operator=(const Watch&) = delete;
        ~Watch();

        void cancel();
        [[nodiscard]] bool isActive() const;

    private:
        std::weak_ptr<WatcherRegistry> registry_;
        uint64_t id_{0};
        std::shared_ptr<Watcher> watcher_;
    };

    FilterStore();

    template <typename Func>
    auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<Transaction&>())) {
        return run(ctx, false, std::forward<Func>(func));
    }

    // Read-only transaction; mutators throw std::logic_error.
    template <typename Func>
    auto read(const std::string& ctx, Func&& func) -> decltype(func(std::declval<Transaction&>())) {
        return run(ctx, true, std::forward<Func>(func));
    }

    [[nodiscard]] std::pair<Snapshot, uint64_t> current() const;

    [[nodiscard]] Watch watch(WatchCallback cb, bool emitCurrent = true);

    // Blocks until a snapshot satisfying predicate is observed. Returns false on timeout,
    // throws error::CancelledError when token is cancelled first.
    bool waitUntil(const std::function<bool(const FilterState&)>& predicate,
                   std::chrono::milliseconds timeout,
                   const concurrency::CancellationToken& token = {});

    void save(const std::filesystem::path& path);
    void load(const std::filesystem::path& path);

private:
    struct Published {
        Snapshot snapshot;
        uint64_t version;
    };

    template <typename Func>
    auto run(const std::string& ctx, const bool readOnly, Func&& func) -> decltype(func(std::declval<Transaction&>())) {
        using Result = decltype(func(std::declval<Transaction&>()));
        std::optional<Published> published;

        if constexpr (std::is_void_v<Result>) {
            {
                std::scoped_lock lock(mutex_);
                Transaction txn(data_, readOnly);
                guarded(ctx, txn, [&] { func(txn); });
                published = commit(ctx, txn);
            }
            if (published) publish(*published);
        } else {
            std::optional<Result> result;
            {
                std::scoped_lock lock(mutex_);
                Transaction txn(data_, readOnly);
                guarded(ctx, txn, [&] { result.emplace(func(txn)); });
                published = commit(ctx, txn);
            }
            if (published) publish(*published);
            return std::move(*result);
        }
    }

    void guarded(const std::string& ctx, Transaction& txn, const std::function<void()>& body);
    std::optional<Published> commit(const std::string& ctx, Transaction& txn);
    void publish(const Published& published);
    static void deliver(const std::shared_ptr<Watcher>& watcher, const Published& published);

    mutable std::mutex mutex_;
    StoreData data_;
    Snapshot snapshot_;
    uint64_t version_{0};

    std::shared_ptr<WatcherRegistry> registry_;
};

}
