#pragma once
#include <algorithm>
#include <cmath>
#include <string>
#include "core/detector.hpp"

namespace patterns {

// Candle anatomy of one bar.
struct Candle {
    double open{}, high{}, low{}, close{};

    explicit Candle(const core::PricePoint& p)
        : open(p.open), high(p.high), low(p.low), close(p.close) {}

    double range() const { return high - low; }
    double body() const { return std::abs(close - open); }
    double upper_wick() const { return high - std::max(open, close); }
    double lower_wick() const { return std::min(open, close) - low; }
    double midpoint() const { return (open + close) / 2.0; }
    bool bullish() const { return close > open; }
    bool bearish() const { return close < open; }
};

// Single, two and three candle rules on the last bars of the series:
// Doji, Hammer, Hanging Man, Engulfing, Piercing Line, Dark Cloud Cover,
// Morning Star and Evening Star.
class CandlestickDetector {
public:
    std::string id() const { return "candlestick"; }
    core::Category category() const { return core::Category::Candlestick; }
    std::size_t min_bars() const { return 3; }
    core::Instances detect(const core::Series& s, const core::AnalysisConfig& cfg) const;
};

} // namespace patterns
