#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace nhdsync {

/**
 * @brief Key/value cache with per-entry expiry and single-flight fetching.
 *
 * - A fresh entry is returned without invoking the fetcher.
 * - Concurrent misses on the same key share one fetcher invocation; every
 *   waiter receives its value or its exception.
 * - A failed fetch leaves any expired entry in place so get_or_stale() can
 *   fall back to it.
 * - A successful fetch replaces the entry and restarts its expiry.
 */
template <typename Key, typename Value>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;
    using Fetcher = std::function<Value()>;

    struct Lookup {
        Value value;
        bool stale{false};
    };

    explicit TtlCache(TimeSource now = [] { return Clock::now(); }) : now_(std::move(now)) {}

    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;

    Value get_or_fetch(const Key& key, Clock::duration ttl, const Fetcher& fetch) {
        std::promise<Value> promise;
        std::shared_future<Value> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end() && now_() < it->second.expires_at) {
                return it->second.value;
            }
            auto flight = in_flight_.find(key);
            if (flight != in_flight_.end()) {
                pending = flight->second;
            } else {
                in_flight_.emplace(key, promise.get_future().share());
            }
        }

        if (pending.valid()) {
            return pending.get();
        }

        try {
            Value value = fetch();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                entries_.insert_or_assign(key, Entry{value, now_() + ttl});
                in_flight_.erase(key);
            }
            promise.set_value(value);
            return value;
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                in_flight_.erase(key);
            }
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    // Error-tolerant read: when the fetch fails and an expired entry exists,
    // that entry is returned flagged as stale instead of the error.
    Lookup get_or_stale(const Key& key, Clock::duration ttl, const Fetcher& fetch) {
        try {
            return Lookup{get_or_fetch(key, ttl, fetch), false};
        } catch (const std::exception&) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                throw;
            }
            return Lookup{it->second.value, true};
        }
    }

    std::optional<Value> peek(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || !(now_() < it->second.expires_at)) {
            return std::nullopt;
        }
        return it->second.value;
    }

    // Forces the next read to fetch; the old value stays as a stale fallback.
    void invalidate(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.expires_at = Clock::time_point::min();
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        Value value;
        Clock::time_point expires_at;
    };

    TimeSource now_;
    mutable std::mutex mutex_;
    std::map<Key, Entry> entries_;
    std::map<Key, std::shared_future<Value>> in_flight_;
};

}  // namespace nhdsync
