#pragma once

#include "engine/sample.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace vigil {

class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& what)
        : std::runtime_error(what) {}
};

// Side cache of raw samples keyed by device and timestamp. Writes are
// best-effort: implementations report failure by throwing CacheError.
class ISampleCache {
public:
    virtual ~ISampleCache() = default;
    virtual void put(const Sample& sample, std::chrono::seconds ttl) = 0;
    virtual std::optional<Sample> get(const std::string& entity_id,
                                      std::int64_t timestamp) = 0;
    virtual bool ping() = 0;
};

std::string cache_key(const std::string& entity_id, std::int64_t timestamp);

class InMemorySampleCache : public ISampleCache {
public:
    static constexpr std::size_t kDefaultMaxEntries = 100000;

    explicit InMemorySampleCache(std::size_t max_entries = kDefaultMaxEntries);

    void put(const Sample& sample, std::chrono::seconds ttl) override;
    std::optional<Sample> get(const std::string& entity_id,
                              std::int64_t timestamp) override;
    bool ping() override { return true; }

    std::size_t size() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::string payload;
        Clock::time_point expires_at;
    };

    void purge_expired_locked(Clock::time_point now);

    std::size_t max_entries_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace vigil
