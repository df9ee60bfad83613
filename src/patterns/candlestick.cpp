#include "patterns/candlestick.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace patterns {

namespace {

constexpr double kDojiBody   = 0.10;
constexpr double kSmallBody  = 0.30;
constexpr double kLongWick   = 0.60;
constexpr double kShortWick  = 0.10;
constexpr double kLargeBody  = 0.60;

core::PatternInstance candle_instance(const char* name, core::Signal sig, double confidence,
                                      std::size_t first, std::size_t last){
    core::PatternInstance p;
    p.pattern    = name;
    p.category   = core::Category::Candlestick;
    p.confidence = core::clamp_confidence(confidence);
    p.signal     = sig;
    p.span       = {first, last};
    return p;
}

void single_candle(const Candle& prev, const Candle& cur, std::size_t i, core::Instances& out){
    const double range = cur.range();
    if (range <= 0.0) return;
    const double body_ratio  = cur.body() / range;
    const double lower_ratio = cur.lower_wick() / range;

    const bool hammer_shape = body_ratio < kSmallBody && lower_ratio > kLongWick
                           && cur.lower_wick() >= 2.0 * cur.body()
                           && cur.upper_wick() / range < kShortWick;
    if (hammer_shape) {
        if (cur.close < prev.close) {
            auto p = candle_instance("Hammer", core::Signal::Buy, std::min(70.0, 40.0 + 50.0 * lower_ratio), i, i);
            p.key_levels = {{"low", cur.low}, {"close", cur.close}};
            p.description = fmt::format("Hammer: long lower wick to {:.2f} after a decline, bullish reversal", cur.low);
            out.push_back(std::move(p));
        } else {
            auto p = candle_instance("Hanging Man", core::Signal::Sell, std::min(65.0, 35.0 + 40.0 * lower_ratio), i, i);
            p.key_levels = {{"low", cur.low}, {"close", cur.close}};
            p.description = fmt::format("Hanging Man: long lower wick to {:.2f} after a rise, bearish warning", cur.low);
            out.push_back(std::move(p));
        }
        return;
    }
    if (body_ratio < kDojiBody) {
        auto p = candle_instance("Doji", core::Signal::Hold, std::min(60.0, 30.0 + 30.0 * (1.0 - body_ratio)), i, i);
        p.key_levels = {{"high", cur.high}, {"low", cur.low}};
        p.description = "Doji: open and close almost equal, market indecision";
        out.push_back(std::move(p));
    }
}

void two_candles(const Candle& prev, const Candle& cur, std::size_t i, core::Instances& out){
    if (prev.range() <= 0.0 || cur.range() <= 0.0 || prev.body() <= 0.0) return;
    const double ratio = cur.body() / prev.body();

    if (prev.bearish() && cur.bullish()) {
        if (ratio > 1.0 && cur.open <= prev.close && cur.close > prev.open) {
            auto p = candle_instance("Bullish Engulfing", core::Signal::Buy, std::min(75.0, 50.0 + 25.0 * (ratio - 1.0)), i - 1, i);
            p.key_levels = {{"engulfed_open", prev.open}, {"engulfed_close", prev.close}};
            p.description = fmt::format("Bullish Engulfing: body {:.1f}x the prior bearish candle", ratio);
            out.push_back(std::move(p));
        } else if (cur.open < prev.close && cur.close > prev.midpoint() && cur.close < prev.open) {
            const double pen = (cur.close - prev.close) / prev.body();
            auto p = candle_instance("Piercing Line", core::Signal::Buy, std::min(70.0, 40.0 + 40.0 * pen), i - 1, i);
            p.key_levels = {{"midpoint", prev.midpoint()}, {"close", cur.close}};
            p.description = fmt::format("Piercing Line: gap down recovered {:.0f}% of the prior body", pen * 100.0);
            out.push_back(std::move(p));
        }
    } else if (prev.bullish() && cur.bearish()) {
        if (ratio > 1.0 && cur.open >= prev.close && cur.close < prev.open) {
            auto p = candle_instance("Bearish Engulfing", core::Signal::Sell, std::min(75.0, 50.0 + 25.0 * (ratio - 1.0)), i - 1, i);
            p.key_levels = {{"engulfed_open", prev.open}, {"engulfed_close", prev.close}};
            p.description = fmt::format("Bearish Engulfing: body {:.1f}x the prior bullish candle", ratio);
            out.push_back(std::move(p));
        } else if (cur.open > prev.close && cur.close < prev.midpoint() && cur.close > prev.open) {
            const double pen = (prev.close - cur.close) / prev.body();
            auto p = candle_instance("Dark Cloud Cover", core::Signal::Sell, std::min(70.0, 40.0 + 40.0 * pen), i - 1, i);
            p.key_levels = {{"midpoint", prev.midpoint()}, {"close", cur.close}};
            p.description = fmt::format("Dark Cloud Cover: gap up gave back {:.0f}% of the prior body", pen * 100.0);
            out.push_back(std::move(p));
        }
    }
}

void three_candles(const Candle& a, const Candle& b, const Candle& c, std::size_t i, core::Instances& out){
    if (a.range() <= 0.0 || b.range() <= 0.0 || c.range() <= 0.0) return;
    if (a.body() / a.range() < kLargeBody) return;
    const double mid_ratio = b.body() / a.body();
    if (mid_ratio >= kSmallBody) return;
    const double base = 65.0 + 10.0 * (1.0 - mid_ratio / kSmallBody);

    if (a.bearish() && c.bullish() && c.close > a.midpoint()) {
        const bool gap = std::max(b.open, b.close) < a.close;
        auto p = candle_instance("Morning Star", core::Signal::Buy, base + (gap ? 10.0 : 0.0), i - 2, i);
        p.key_levels = {{"star_low", b.low}, {"first_midpoint", a.midpoint()}};
        p.description = fmt::format("Morning Star: three-candle bullish reversal from {:.2f}", b.low);
        out.push_back(std::move(p));
    } else if (a.bullish() && c.bearish() && c.close < a.midpoint()) {
        const bool gap = std::min(b.open, b.close) > a.close;
        auto p = candle_instance("Evening Star", core::Signal::Sell, base + (gap ? 10.0 : 0.0), i - 2, i);
        p.key_levels = {{"star_high", b.high}, {"first_midpoint", a.midpoint()}};
        p.description = fmt::format("Evening Star: three-candle bearish reversal from {:.2f}", b.high);
        out.push_back(std::move(p));
    }
}

} // namespace

core::Instances CandlestickDetector::detect(const core::Series& s, const core::AnalysisConfig&) const {
    core::Instances out;
    if (s.size() < min_bars()) return out;
    const std::size_t i = s.size() - 1;
    const Candle a(s[i - 2]), b(s[i - 1]), c(s[i]);
    single_candle(b, c, i, out);
    two_candles(b, c, i, out);
    three_candles(a, b, c, i, out);
    return out;
}

} // namespace patterns
