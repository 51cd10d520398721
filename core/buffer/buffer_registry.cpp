#include "buffer/buffer_registry.h"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace vigil {

BufferRegistry::BufferRegistry(std::size_t buffer_capacity)
    : buffer_capacity_(buffer_capacity) {
    if (buffer_capacity_ == 0) {
        throw std::invalid_argument("buffer capacity must be positive");
    }
}

std::shared_ptr<DeviceBuffer> BufferRegistry::get_or_create(const std::string& entity_id) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = buffers_.find(entity_id);
        if (it != buffers_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    // Another writer may have created it between the two locks
    auto it = buffers_.find(entity_id);
    if (it == buffers_.end()) {
        it = buffers_.emplace(entity_id,
                              std::make_shared<DeviceBuffer>(buffer_capacity_)).first;
    }
    return it->second;
}

std::shared_ptr<DeviceBuffer> BufferRegistry::find(const std::string& entity_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = buffers_.find(entity_id);
    if (it == buffers_.end()) {
        return nullptr;
    }
    return it->second;
}

std::size_t BufferRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return buffers_.size();
}

std::vector<std::string> BufferRegistry::entity_ids() const {
    std::vector<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        ids.reserve(buffers_.size());
        for (const auto& [id, buffer] : buffers_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace vigil
