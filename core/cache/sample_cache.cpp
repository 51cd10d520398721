#include "cache/sample_cache.h"

#include <utility>

namespace vigil {

std::string cache_key(const std::string& entity_id, std::int64_t timestamp) {
    return "metric:" + entity_id + ":" + std::to_string(timestamp);
}

InMemorySampleCache::InMemorySampleCache(std::size_t max_entries)
    : max_entries_(max_entries) {}

void InMemorySampleCache::put(const Sample& sample, std::chrono::seconds ttl) {
    auto key = cache_key(sample.entity_id, sample.timestamp);
    auto payload = to_json(sample).dump();
    auto now = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end() && entries_.size() >= max_entries_) {
        purge_expired_locked(now);
        if (entries_.size() >= max_entries_) {
            throw CacheError("cache full (" + std::to_string(max_entries_) +
                             " entries), dropping " + key);
        }
    }

    entries_[key] = Entry{std::move(payload), now + ttl};
}

std::optional<Sample> InMemorySampleCache::get(const std::string& entity_id,
                                               std::int64_t timestamp) {
    std::string payload;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(cache_key(entity_id, timestamp));
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (it->second.expires_at <= Clock::now()) {
            entries_.erase(it);
            return std::nullopt;
        }
        payload = it->second.payload;
    }
    return parse_sample(payload);
}

std::size_t InMemorySampleCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void InMemorySampleCache::purge_expired_locked(Clock::time_point now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at <= now) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace vigil
