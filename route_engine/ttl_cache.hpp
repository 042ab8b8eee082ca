#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

// Mutex-guarded map whose entries expire ttl after insertion. Entries may be
// evicted at any time; callers treat a miss as "ask again".
template <typename K, typename V>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit TtlCache(std::chrono::seconds ttl, NowFn now = [] { return Clock::now(); })
        : ttl_(ttl), now_(std::move(now)) {}

    std::optional<V> get(const K& key) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        if (it->second.expires_at <= now_()) {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    void put(const K& key, V value) {
        std::lock_guard<std::mutex> lock(mu_);
        entries_[key] = Entry{std::move(value), now_() + ttl_};
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mu_);
        entries_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return entries_.size();
    }

private:
    struct Entry {
        V value;
        Clock::time_point expires_at;
    };

    std::chrono::seconds ttl_;
    NowFn now_;
    mutable std::mutex mu_;
    std::unordered_map<K, Entry> entries_;
};
