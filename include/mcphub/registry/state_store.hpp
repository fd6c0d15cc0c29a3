#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace mcphub {

// ---------------------------------------------------------------------------
// StateStore<T>: owned, copy-on-write state with change broadcast.
//
// Readers take an immutable snapshot (shared_ptr<const T>) and never see a
// half-applied change. Writers submit a command that edits a private copy;
// commands run one at a time in submission order, and every listener is
// handed each published snapshot in that same order.
//
// Listeners run on the updating thread and must not call Update().
// ---------------------------------------------------------------------------
template <typename T>
class StateStore {
public:
    using Snapshot = std::shared_ptr<const T>;
    using Listener = std::function<void(const Snapshot&)>;
    using SubscriptionId = uint64_t;

    explicit StateStore(T initial = T{})
        : current_(std::make_shared<const T>(std::move(initial))) {}

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    [[nodiscard]] Snapshot Get() const {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        return current_;
    }

    // command: void(T&). Returns the snapshot it published.
    template <typename Fn>
    Snapshot Update(Fn&& command) {
        std::lock_guard<std::mutex> update_lock(update_mutex_);
        auto next = std::make_shared<T>(*Get());
        std::forward<Fn>(command)(*next);
        Snapshot published = std::move(next);
        {
            std::lock_guard<std::mutex> lock(snapshot_mutex_);
            current_ = published;
        }
        for (const auto& listener : Listeners()) {
            listener(published);
        }
        return published;
    }

    SubscriptionId Subscribe(Listener listener) {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        auto id = ++next_subscription_;
        listeners_.emplace(id, std::move(listener));
        return id;
    }

    void Unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners_.erase(id);
    }

private:
    std::vector<Listener> Listeners() const {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        std::vector<Listener> out;
        out.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            out.push_back(listener);
        }
        return out;
    }

    mutable std::mutex snapshot_mutex_;
    std::mutex update_mutex_;
    Snapshot current_;

    mutable std::mutex listeners_mutex_;
    std::map<SubscriptionId, Listener> listeners_;
    SubscriptionId next_subscription_ = 0;
};

} // namespace mcphub
