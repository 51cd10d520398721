#include "stats/rolling_statistics.h"

#include <cmath>

namespace vigil {

WindowStats window_stats(const std::vector<double>& values, std::size_t window) {
    WindowStats stats;

    std::size_t start = 0;
    if (values.size() > window) {
        start = values.size() - window;
    }

    stats.count = values.size() - start;
    if (stats.count == 0) {
        return stats;
    }

    double sum = 0.0;
    for (std::size_t i = start; i < values.size(); ++i) {
        sum += values[i];
    }
    stats.mean = sum / static_cast<double>(stats.count);

    if (stats.count < 2) {
        return stats;
    }

    double variance = 0.0;
    for (std::size_t i = start; i < values.size(); ++i) {
        double diff = values[i] - stats.mean;
        variance += diff * diff;
    }
    variance /= static_cast<double>(stats.count);
    stats.std_dev = std::sqrt(variance);

    return stats;
}

} // namespace vigil
