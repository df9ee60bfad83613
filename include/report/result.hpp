#pragma once
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "strategy/aggregator.hpp"

namespace report {

using strategy::CategorySummary;

// Public result of one analysis call.
struct AnalysisResult {
    std::string instrument_id;
    core::Signal overall_signal{core::Signal::Hold};
    double overall_confidence{0.0};
    std::size_t patterns_detected{0};
    std::vector<core::PatternInstance> top_patterns;
    std::map<core::Category, CategorySummary> category_summary;
    std::string summary;
    std::vector<std::string> skipped;   // detectors that failed, "<id>: <reason>"
};

bool operator==(const AnalysisResult& a, const AnalysisResult& b);
inline bool operator!=(const AnalysisResult& a, const AnalysisResult& b) { return !(a == b); }

AnalysisResult make_result(const std::string& instrument_id, std::size_t patterns_detected,
                           const strategy::Aggregate& agg, std::vector<std::string> skipped = {});

nlohmann::json to_json(const core::PatternInstance& p);
nlohmann::json to_json(const AnalysisResult& r);

// Throws core::ResultFormatError on missing fields, wrong types or unknown names.
core::PatternInstance instance_from_json(const nlohmann::json& j);
AnalysisResult from_json(const nlohmann::json& j);

// One line, e.g. "AAPL: BUY 74% | Primary: Double Bottom (88%) | Additional patterns: 2"
std::string summarize(const AnalysisResult& r);

// Short textbook meaning of a pattern name; empty for unknown names.
std::string explain(const std::string& pattern);

} // namespace report
