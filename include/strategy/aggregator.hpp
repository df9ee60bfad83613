#pragma once
#include <map>
#include <vector>
#include "core/config.hpp"
#include "core/detector.hpp"

namespace strategy {

struct CategorySummary {
    std::size_t count{0};
    core::Signal dominant_signal{core::Signal::Hold};
};

bool operator==(const CategorySummary& a, const CategorySummary& b);

struct Aggregate {
    core::Signal signal{core::Signal::Hold};
    double confidence{0.0};                 // 0..100
    double bullish_score{0.0};              // sum of weighted BUY confidences
    double bearish_score{0.0};
    std::size_t considered{0};              // instances above min_confidence
    core::Instances ranked;                 // best top_n, strongest first
    std::map<core::Category, CategorySummary> categories;
};

// confidence * category weight
double weighted_confidence(const core::PatternInstance& p, const core::AnalysisConfig& cfg);

// Merges all instances of one series into an overall signal.
//
//  - only instances above cfg.min_confidence take part
//  - bullish/bearish = sum of weighted confidences per side; HOLD adds to neither
//  - the larger side wins when it leads by more than decisiveness_threshold
//    of itself, otherwise HOLD
//  - confidence = 0.6 * min(100, winning score) + 0.4 * 100 * agreement,
//    where agreement is the share of instances carrying the winning signal
//  - HOLD scores max(weighted HOLD score, larger side) and is capped at 70
//  - ranking: weighted confidence desc, then category priority, then input order
Aggregate aggregate(const core::Instances& instances, const core::AnalysisConfig& cfg);

} // namespace strategy
