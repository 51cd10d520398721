#pragma once

#include "stats/rolling_statistics.h"

#include <cstddef>
#include <shared_mutex>
#include <vector>

namespace vigil {

// Bounded append-only history of one entity's values. The oldest value is
// evicted once capacity is reached. Appends are exclusive, reads are shared.
class DeviceBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit DeviceBuffer(std::size_t capacity = kDefaultCapacity);

    void append(double value);

    // Returns the last `window` values, oldest first.
    std::vector<double> snapshot_window(std::size_t window) const;

    WindowStats window_stats(std::size_t window) const;

    // Returns every retained value, oldest first.
    std::vector<double> values() const;

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    std::vector<double> collect_locked(std::size_t window) const;

    std::size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::vector<double> ring_;
    std::size_t head_ = 0;  // slot of the oldest value once the ring is full
};

} // namespace vigil
