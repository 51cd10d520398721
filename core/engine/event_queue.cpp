#include "engine/event_queue.h"

#include <stdexcept>
#include <utility>

namespace vigil {

AnomalyEventQueue::AnomalyEventQueue(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("event queue capacity must be positive");
    }
}

bool AnomalyEventQueue::try_enqueue(AnalyticsResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.size() >= capacity_) {
        ++dropped_;
        return false;
    }
    events_.push_back(std::move(result));
    return true;
}

std::vector<AnalyticsResult> AnomalyEventQueue::drain(std::chrono::milliseconds max_wait) {
    std::vector<AnalyticsResult> collected;
    auto deadline = std::chrono::steady_clock::now() + max_wait;

    DrainStep step = DrainStep::COLLECTING;
    while (step == DrainStep::COLLECTING) {
        // Always attempt at least one read, even with a zero grace window
        if (!collected.empty() && std::chrono::steady_clock::now() >= deadline) {
            step = DrainStep::DEADLINE;
            continue;
        }
        step = pop_one(collected);
    }

    return collected;
}

AnomalyEventQueue::DrainStep AnomalyEventQueue::pop_one(std::vector<AnalyticsResult>& out) {
    // Lock per item so producers can interleave with a long drain
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return DrainStep::EMPTY;
    }
    out.push_back(std::move(events_.front()));
    events_.pop_front();
    return DrainStep::COLLECTING;
}

std::size_t AnomalyEventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::size_t AnomalyEventQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace vigil
