#include "engine/anomaly_classifier.h"

#include <cmath>

namespace vigil {

AnomalyClassifier::AnomalyClassifier(const BufferRegistry& registry,
                                     std::size_t window)
    : registry_(registry), window_(window) {}

AnalyticsResult AnomalyClassifier::classify(const std::string& entity_id,
                                            double value,
                                            std::int64_t timestamp) const {
    WindowStats stats;
    if (auto buffer = registry_.find(entity_id)) {
        stats = buffer->window_stats(window_);
    }

    ZScoreVerdict verdict = evaluate(value, stats);

    AnalyticsResult result;
    result.entity_id = entity_id;
    result.rolling_average = stats.mean;
    result.z_score = verdict.z_score;
    result.is_anomaly = verdict.is_anomaly;
    result.timestamp = timestamp;
    result.value = value;
    return result;
}

ZScoreVerdict AnomalyClassifier::evaluate(double value, const WindowStats& stats) {
    ZScoreVerdict verdict;

    // A single point or a flat window has no meaningful deviation
    if (stats.count < 2 || stats.std_dev == 0.0) {
        return verdict;
    }

    verdict.z_score = (value - stats.mean) / stats.std_dev;
    verdict.is_anomaly = std::abs(verdict.z_score) > kAnomalyThreshold;
    return verdict;
}

} // namespace vigil
