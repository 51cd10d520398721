#pragma once

#include "buffer/device_buffer.h"

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil {

// Owns one DeviceBuffer per entity. Buffers are created on first write and
// never removed.
class BufferRegistry {
public:
    explicit BufferRegistry(std::size_t buffer_capacity = DeviceBuffer::kDefaultCapacity);

    // Returns the entity's buffer, creating it exactly once under contention.
    std::shared_ptr<DeviceBuffer> get_or_create(const std::string& entity_id);

    // Returns nullptr for an entity that has never been written.
    std::shared_ptr<DeviceBuffer> find(const std::string& entity_id) const;

    std::size_t size() const;
    std::vector<std::string> entity_ids() const;

    std::size_t buffer_capacity() const { return buffer_capacity_; }

private:
    std::size_t buffer_capacity_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<DeviceBuffer>> buffers_;
};

} // namespace vigil
