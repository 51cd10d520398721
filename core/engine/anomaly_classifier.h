#pragma once

#include "buffer/buffer_registry.h"
#include "engine/sample.h"
#include "stats/rolling_statistics.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace vigil {

struct ZScoreVerdict {
    double z_score = 0.0;
    bool is_anomaly = false;
};

// Flags a value whose z-score against the entity's recent window exceeds
// kAnomalyThreshold in absolute value. The window is expected to already
// contain the value being classified.
class AnomalyClassifier {
public:
    static constexpr double kAnomalyThreshold = 2.0;
    static constexpr std::size_t kDefaultWindow = 50;

    explicit AnomalyClassifier(const BufferRegistry& registry,
                               std::size_t window = kDefaultWindow);

    AnalyticsResult classify(const std::string& entity_id, double value,
                             std::int64_t timestamp) const;

    static ZScoreVerdict evaluate(double value, const WindowStats& stats);

    std::size_t window() const { return window_; }

private:
    const BufferRegistry& registry_;
    std::size_t window_;
};

} // namespace vigil
