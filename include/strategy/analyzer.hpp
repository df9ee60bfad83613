#pragma once
#include <iterator>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "core/config.hpp"
#include "patterns/breakout.hpp"
#include "patterns/candlestick.hpp"
#include "patterns/continuation.hpp"
#include "patterns/reversal.hpp"
#include "report/result.hpp"
#include "strategy/aggregator.hpp"

namespace strategy {

// The fixed detector catalogue.
using Detector = std::variant<patterns::ReversalDetector,
                              patterns::ContinuationDetector,
                              patterns::BreakoutDetector,
                              patterns::CandlestickDetector>;

// One detector per category, in category-priority order.
std::vector<Detector> default_detectors();

// Throws core::InvalidSeries for non-increasing timestamps, non-finite
// prices or bars with high < low. An empty series is valid.
void validate_series(const core::Series& s);

// Runs each detector in order. A detector below its minimum length adds
// nothing; one that throws loses its instances and is listed in `skipped`.
template <class... D>
core::Instances run_detectors(const std::vector<std::variant<D...>>& detectors, const core::Series& s,
                              const core::AnalysisConfig& cfg, std::vector<std::string>& skipped){
    core::Instances out;
    for (const auto& d : detectors) {
        std::visit([&](const auto& det){
            if (s.size() < det.min_bars()) {
                spdlog::debug("{}: {} bars, needs {}", det.id(), s.size(), det.min_bars());
                return;
            }
            try {
                auto found = det.detect(s, cfg);
                out.insert(out.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
            } catch (const std::exception& e) {
                spdlog::warn("detector '{}' skipped: {}", det.id(), e.what());
                skipped.push_back(fmt::format("{}: {}", det.id(), e.what()));
            }
        }, d);
    }
    return out;
}

// Validate, detect, aggregate, format.
template <class... D>
report::AnalysisResult analyze_with(const std::vector<std::variant<D...>>& detectors,
                                    const std::string& instrument_id, const core::Series& s,
                                    const core::AnalysisConfig& cfg){
    validate_series(s);
    std::vector<std::string> skipped;
    const auto found = run_detectors(detectors, s, cfg, skipped);
    auto agg = aggregate(found, cfg);
    spdlog::debug("{}: {} patterns, {} {:.1f}", instrument_id, agg.considered,
                  core::to_string(agg.signal), agg.confidence);
    return report::make_result(instrument_id, agg.considered, agg, std::move(skipped));
}

// analyze_with(default_detectors(), ...)
report::AnalysisResult analyze(const std::string& instrument_id, const core::Series& s,
                               const core::AnalysisConfig& cfg = {});

using Instrument = std::pair<std::string, core::Series>;

// One analysis per instrument on its own task; results in input order.
// An InvalidSeries of any instrument is rethrown here.
std::vector<report::AnalysisResult> analyze_all(const std::vector<Instrument>& instruments,
                                                const core::AnalysisConfig& cfg = {});

} // namespace strategy
