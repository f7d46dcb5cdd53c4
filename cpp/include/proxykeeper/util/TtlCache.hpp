#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace proxykeeper::util {

// Key -> (value, insertedAt) map whose entries stop counting once older than the ttl.
// Stale entries stay physically present until sweepExpired() runs, but every *Fresh
// accessor treats them as absent.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        Value value;
        Clock::time_point insertedAt;
    };

    explicit TtlCache(std::chrono::milliseconds ttl)
        : ttl_(ttl) {}

    static bool isFresh(Clock::time_point insertedAt,
                        std::chrono::milliseconds ttl,
                        Clock::time_point now) {
        return now - insertedAt < ttl;
    }

    std::chrono::milliseconds ttl() const { return ttl_; }

    // Raw lookup, freshness is not checked.
    std::optional<Entry> find(const Key& key) const {
        std::scoped_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<Value> findFresh(const Key& key, Clock::time_point now = Clock::now()) const {
        std::scoped_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || !isFresh(it->second.insertedAt, ttl_, now)) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void put(const Key& key, Value value, Clock::time_point now = Clock::now()) {
        std::scoped_lock lock(mutex_);
        entries_.insert_or_assign(key, Entry{std::move(value), now});
    }

    // Fresh keys accepted by predicate(key, value), at most limit of them. The predicate
    // runs under the cache lock.
    template <typename Predicate>
    std::vector<Key> freshKeys(Predicate&& predicate,
                               std::size_t limit,
                               Clock::time_point now = Clock::now()) const {
        std::vector<Key> keys;
        std::scoped_lock lock(mutex_);
        for (const auto& [key, entry] : entries_) {
            if (keys.size() >= limit) {
                break;
            }
            if (isFresh(entry.insertedAt, ttl_, now) && predicate(key, entry.value)) {
                keys.push_back(key);
            }
        }
        return keys;
    }

    std::size_t sweepExpired(Clock::time_point now = Clock::now()) {
        std::size_t removed = 0;
        std::scoped_lock lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (!isFresh(it->second.insertedAt, ttl_, now)) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    std::size_t size() const {
        std::scoped_lock lock(mutex_);
        return entries_.size();
    }

    bool empty() const { return size() == 0; }

private:
    std::chrono::milliseconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<Key, Entry, Hash> entries_;
};

} // namespace proxykeeper::util
