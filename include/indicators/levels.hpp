#pragma once
#include <vector>
#include "indicators/extrema.hpp"

namespace ind {

enum class LevelKind { Support, Resistance };

// Horizontal price level built from nearby extrema.
struct Level {
    double price{0.0};                // mean of the member prices
    std::size_t touch_count{0};
    LevelKind kind{LevelKind::Resistance};
    std::vector<std::size_t> indices; // ascending
};

// Single-linkage clustering: sort by price, then merge each extremum into the
// current cluster while it lies within `tolerance` (relative) of the cluster
// mean. Levels come back ordered by price. O(n log n).
std::vector<Level> cluster_levels(const std::vector<Extremum>& extrema, LevelKind kind,
                                  double tolerance = 0.02);

// Levels with at least `min_touches` touches.
std::vector<Level> filter_levels(const std::vector<Level>& levels, std::size_t min_touches = 3);

} // namespace ind
