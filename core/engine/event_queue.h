#pragma once

#include "engine/sample.h"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace vigil {

// Bounded, lossy FIFO of classification results. Producers never wait for
// space: a result offered to a full queue is dropped.
class AnomalyEventQueue {
public:
    static constexpr std::size_t kDefaultCapacity = 100;

    explicit AnomalyEventQueue(std::size_t capacity = kDefaultCapacity);

    // Returns false if the queue is full and the result was dropped.
    bool try_enqueue(AnalyticsResult result);

    // Removes queued results one at a time until a read finds the queue
    // empty or max_wait elapses, whichever comes first.
    std::vector<AnalyticsResult> drain(std::chrono::milliseconds max_wait);

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::size_t dropped() const;

private:
    enum class DrainStep {
        COLLECTING,
        EMPTY,
        DEADLINE
    };

    DrainStep pop_one(std::vector<AnalyticsResult>& out);

    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<AnalyticsResult> events_;
    std::size_t dropped_ = 0;
};

} // namespace vigil
