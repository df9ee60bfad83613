#pragma once
#include <optional>
#include <string>
#include "core/detector.hpp"

namespace patterns {

// Head-and-Shoulders (plus inverse) and Double Top / Double Bottom.
class ReversalDetector {
public:
    std::string id() const { return "reversal"; }
    core::Category category() const { return core::Category::Reversal; }
    std::size_t min_bars() const { return 30; }
    core::Instances detect(const core::Series& s, const core::AnalysisConfig& cfg) const;
};

// Needs at least 40 bars. `inverse` looks for the bullish variant on valleys.
std::optional<core::PatternInstance>
detect_head_and_shoulders(const core::Series& s, const core::AnalysisConfig& cfg, bool inverse);

// `bottom` looks for the bullish variant on valleys.
std::optional<core::PatternInstance>
detect_double(const core::Series& s, const core::AnalysisConfig& cfg, bool bottom);

} // namespace patterns
