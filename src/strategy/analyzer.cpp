#include "strategy/analyzer.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <future>

namespace strategy {

std::vector<Detector> default_detectors(){
    return {patterns::ReversalDetector{}, patterns::ContinuationDetector{},
            patterns::BreakoutDetector{}, patterns::CandlestickDetector{}};
}

void validate_series(const core::Series& s){
    for (std::size_t i = 0; i < s.size(); ++i) {
        const auto& p = s[i];
        if (i > 0 && p.timestamp_ms <= s[i - 1].timestamp_ms)
            throw core::InvalidSeries(fmt::format("bar {}: timestamp {} does not follow {}",
                                                  i, p.timestamp_ms, s[i - 1].timestamp_ms));
        if (!std::isfinite(p.open) || !std::isfinite(p.high) || !std::isfinite(p.low) || !std::isfinite(p.close))
            throw core::InvalidSeries(fmt::format("bar {}: non-finite price", i));
        if (p.high < p.low)
            throw core::InvalidSeries(fmt::format("bar {}: high {} below low {}", i, p.high, p.low));
        if (p.volume && !std::isfinite(*p.volume))
            throw core::InvalidSeries(fmt::format("bar {}: non-finite volume", i));
    }
}

report::AnalysisResult analyze(const std::string& instrument_id, const core::Series& s,
                               const core::AnalysisConfig& cfg){
    static const std::vector<Detector> detectors = default_detectors();
    return analyze_with(detectors, instrument_id, s, cfg);
}

std::vector<report::AnalysisResult> analyze_all(const std::vector<Instrument>& instruments,
                                                const core::AnalysisConfig& cfg){
    std::vector<std::future<report::AnalysisResult>> jobs;
    jobs.reserve(instruments.size());
    for (const auto& inst : instruments)
        jobs.push_back(std::async(std::launch::async,
                                  [&inst, &cfg]{ return analyze(inst.first, inst.second, cfg); }));

    std::vector<report::AnalysisResult> out;
    out.reserve(jobs.size());
    for (auto& j : jobs) out.push_back(j.get());
    return out;
}

} // namespace strategy
