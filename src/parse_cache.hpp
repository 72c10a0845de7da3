#pragma once

/**
 * Bounded least-recently-used cache for parsed values.
 *
 * Color and style strings are parsed over and over during a render pass, so
 * both parsers memoize their results in an LruCache keyed by the normalized
 * input. Each cache is guarded by its own mutex held for one lookup or insert.
 * Caching is an optimization only: with caching disabled every lookup misses
 * and parse results are identical.
 */

#include <atomic>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace rich {

// Process-wide switch consulted by every LruCache on lookup and insert.
inline std::atomic<bool> g_parse_cache_enabled{true};

// Enables or disables all parse caches (tests use this to rule out cross-test effects).
inline void set_parse_cache_enabled(bool enabled) {
    g_parse_cache_enabled.store(enabled);
}

inline bool parse_cache_enabled() {
    return g_parse_cache_enabled.load();
}

template <typename Key, typename Value>
class LruCache {
public:
    explicit LruCache(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    // Returns a copy of the cached value and marks it most recently used.
    std::optional<Value> get(const Key& key) {
        if (!parse_cache_enabled()) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++misses_;
            return std::nullopt;
        }
        entries_.splice(entries_.begin(), entries_, it->second);
        ++hits_;
        return it->second->second;
    }

    // Inserts or refreshes a value, evicting the least recently used entry when full.
    void put(const Key& key, Value value) {
        if (!parse_cache_enabled()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }
        if (entries_.size() >= capacity_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
        entries_.emplace_front(key, std::move(value));
        index_[key] = entries_.begin();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        index_.clear();
        hits_ = 0;
        misses_ = 0;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::size_t capacity() const { return capacity_; }

    std::size_t hits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    std::size_t misses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

private:
    using Entry = std::pair<Key, Value>;

    std::size_t capacity_;
    std::list<Entry> entries_;  // Front is most recently used.
    std::unordered_map<Key, typename std::list<Entry>::iterator> index_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
    mutable std::mutex mutex_;
};

// Lower-cases ASCII letters and trims surrounding whitespace; the shared cache key form.
inline std::string normalize_key(const std::string& input) {
    const char* ws = " \t\n\r\f\v";
    size_t start = input.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = input.find_last_not_of(ws);
    std::string result = input.substr(start, end - start + 1);
    for (char& c : result) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return result;
}

} // namespace rich
