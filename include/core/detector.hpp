#pragma once
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "core/types.hpp"

namespace core {

using Instances = std::vector<PatternInstance>;

// Detector contract: every pattern detector is a stateless value type with
//
//   std::string id() const;                 // e.g. "reversal"
//   Category category() const;
//   std::size_t min_bars() const;           // shorter series yield no instances
//   Instances detect(const Series&, const AnalysisConfig&) const;
//
// The set of detectors is closed (strategy::Detector) and dispatched with
// std::visit.

// Convenience clamp into 0..1
inline double clamp01(double v) {
    if (std::isnan(v)) return 0.0;
    return std::max(0.0, std::min(1.0, v));
}

// Confidence is always reported in 0..100; NaN degrades to 0.
inline double clamp_confidence(double v) {
    if (std::isnan(v)) return 0.0;
    return std::clamp(v, 0.0, 100.0);
}

// a/b, or 0 when b is (numerically) zero
inline double safe_div(double a, double b) {
    return std::abs(b) > 1e-12 ? a / b : 0.0;
}

} // namespace core
