#pragma once

#include <cstddef>
#include <vector>

namespace vigil {

struct WindowStats {
    double mean = 0.0;
    double std_dev = 0.0;
    std::size_t count = 0;
};

// Mean and population standard deviation over the last `window` values.
// Fewer than `window` values uses all of them; an empty slice yields zeros
// and a single value has a standard deviation of 0.
WindowStats window_stats(const std::vector<double>& values, std::size_t window);

} // namespace vigil
