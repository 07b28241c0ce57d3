// Copyright 2026 Maree Carroll
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#ifndef REP_LOOKUP_CACHE_HPP_
#define REP_LOOKUP_CACHE_HPP_

#include <stddef.h>       // for size_t
#include <chrono>         // for steady_clock
#include <functional>     // for function
#include <mutex>          // for mutex, lock_guard
#include <optional>       // for optional, nullopt
#include <string>         // for string
#include <unordered_map>  // for unordered_map
#include <utility>        // for move

using std::string;
using std::optional;
using std::unordered_map;

namespace cache {

// decimals used for every coordinate cache key
const int KEY_PRECISION = 6;

string cacheKey(double lat, double lon);

// Expiring memo of computed values.
//
// Entries are only evicted when found stale on access; there is no sweep, so
// stale entries that are never asked for again stay in memory. compute runs
// outside the lock: concurrent misses on one key may both compute, and the
// last write wins.
template <typename V>
class TtlCache {
 public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    TtlCache() : now_([] { return Clock::now(); }) {}
    explicit TtlCache(NowFn now) : now_(std::move(now)) {}

    // Returns the cached value for key when it is younger than ttl,
    // otherwise computes, stores and returns a fresh one
    //
    // Args:
    //    key: cache key, see cacheKey()
    //    ttl: maximum age of a reusable entry
    //    compute: called with no arguments on a miss
    template <typename Fn>
    V getOrCompute(const string& key, Clock::duration ttl, Fn&& compute) {
        if (auto hit = get(key, ttl)) return *hit;
        V value = compute();
        put(key, value);
        return value;
    }

    // Fresh value for key, evicting it if stale
    optional<V> get(const string& key, Clock::duration ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        if (now_() - it->second.storedAt > ttl) {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    // Stores value under key, replacing any previous entry
    void put(const string& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = Entry{std::move(value), now_()};
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

 private:
    struct Entry {
        V value;
        Clock::time_point storedAt;
    };

    NowFn now_;
    mutable std::mutex mutex_;
    unordered_map<string, Entry> entries_;
};

}  // namespace cache

#endif  // REP_LOOKUP_CACHE_HPP_
