#include "table/read_cache.hpp"

namespace funtable {

ReadCache::ReadCache(std::chrono::milliseconds ttl,
                     std::shared_ptr<const Clock> clock)
    : ttl_(ttl)
    , clock_(clock ? std::move(clock) : std::make_shared<SteadyClock>())
{}

std::optional<StoreValue> ReadCache::lookup(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (clock_->now() - it->second.fetched_at < ttl_) {
        return it->second.value;
    }
    entries_.erase(it);
    return std::nullopt;
}

void ReadCache::put(const std::string& key, StoreValue value) {
    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(key, Entry{clock_->now(), std::move(value)});
}

void ReadCache::evict(const std::string& key) {
    std::lock_guard lock(mutex_);
    entries_.erase(key);
}

void ReadCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

std::size_t ReadCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

} // namespace funtable
