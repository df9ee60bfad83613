#pragma once
#include <string>
#include <vector>
#include "core/detector.hpp"
#include "indicators/levels.hpp"

namespace patterns {

// Resistance breakouts, support breakdowns and closes approaching a level.
class BreakoutDetector {
public:
    std::string id() const { return "breakout"; }
    core::Category category() const { return core::Category::Breakout; }
    std::size_t min_bars() const { return 50; }
    core::Instances detect(const core::Series& s, const core::AnalysisConfig& cfg) const;
};

struct LevelSet {
    std::size_t base{0};              // series index of level index 0
    std::vector<ind::Level> support;
    std::vector<ind::Level> resistance;
};

// Support and resistance over the last `lookback_window` bars, keeping only
// levels with at least `min_touches` touches.
LevelSet find_levels(const core::Series& s, const core::AnalysisConfig& cfg);

// Last-bar volume over the mean of the 20 bars before it; 0 without volume.
double volume_ratio(const core::Series& s);

} // namespace patterns
