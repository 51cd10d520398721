#include "buffer/device_buffer.h"

#include <mutex>
#include <stdexcept>

namespace vigil {

DeviceBuffer::DeviceBuffer(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("device buffer capacity must be positive");
    }
}

void DeviceBuffer::append(double value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (ring_.size() < capacity_) {
        ring_.push_back(value);
        return;
    }

    // Full: overwrite the oldest slot and advance
    ring_[head_] = value;
    head_ = (head_ + 1) % capacity_;
}

std::vector<double> DeviceBuffer::snapshot_window(std::size_t window) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return collect_locked(window);
}

WindowStats DeviceBuffer::window_stats(std::size_t window) const {
    std::vector<double> recent;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        recent = collect_locked(window);
    }
    return vigil::window_stats(recent, window);
}

std::vector<double> DeviceBuffer::values() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return collect_locked(ring_.size());
}

std::size_t DeviceBuffer::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ring_.size();
}

std::vector<double> DeviceBuffer::collect_locked(std::size_t window) const {
    std::size_t count = ring_.size();
    std::size_t take = window < count ? window : count;

    std::vector<double> result;
    result.reserve(take);

    // Walk from oldest to newest, skipping what falls outside the window
    std::size_t skip = count - take;
    for (std::size_t i = skip; i < count; ++i) {
        result.push_back(ring_[(head_ + i) % count]);
    }

    return result;
}

} // namespace vigil
