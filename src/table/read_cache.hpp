#pragma once

#include "common/clock.hpp"
#include "table/store_value.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace funtable {

// ── ReadCache ────────────────────────────────────────────────────────────────
//
// Per-table-instance cache of recently read or written values.
//
// An entry is served only while now - fetched_at < ttl; an expired entry is
// evicted by the lookup that finds it.  Negative results are never cached.
//
// Thread-safe.

class ReadCache {
public:
    // Default time-to-live.
    static constexpr auto kDefaultTtl = std::chrono::seconds{300};

    ReadCache(std::chrono::milliseconds ttl, std::shared_ptr<const Clock> clock);

    // Returns the cached value for `key` if it is still fresh.
    [[nodiscard]] std::optional<StoreValue> lookup(const std::string& key);

    // Inserts or refreshes `key`, stamped with the current time.
    void put(const std::string& key, StoreValue value);

    void evict(const std::string& key);

    void clear();

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] std::chrono::milliseconds ttl() const noexcept { return ttl_; }

private:
    struct Entry {
        Clock::time_point fetched_at;
        StoreValue        value;
    };

    mutable std::mutex                     mutex_;
    std::chrono::milliseconds              ttl_;
    std::shared_ptr<const Clock>           clock_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace funtable
