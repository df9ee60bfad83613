#pragma once
#include <optional>
#include <string>
#include "core/detector.hpp"

namespace patterns {

// Ascending / descending / symmetrical triangles, flags and pennants.
class ContinuationDetector {
public:
    std::string id() const { return "continuation"; }
    core::Category category() const { return core::Category::Continuation; }
    std::size_t min_bars() const { return 30; }
    core::Instances detect(const core::Series& s, const core::AnalysisConfig& cfg) const;
};

// Trendlines through recent peaks and valleys. Needs at least 40 bars.
std::optional<core::PatternInstance>
detect_triangle(const core::Series& s, const core::AnalysisConfig& cfg);

// Strong pole followed by a tight consolidation of 5-20 bars.
std::optional<core::PatternInstance>
detect_flag_or_pennant(const core::Series& s, const core::AnalysisConfig& cfg);

} // namespace patterns
