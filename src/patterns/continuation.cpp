#include "patterns/continuation.hpp"
#include "indicators/extrema.hpp"
#include "indicators/trendline.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace patterns {

namespace {

constexpr std::size_t kTriangleBars = 40;
constexpr std::size_t kTriangleTouches = 3;
constexpr std::size_t kFlagBars = 30;
constexpr std::size_t kMinConsolidation = 5;
constexpr std::size_t kMaxConsolidation = 20;
constexpr std::size_t kPoleWindow = 10;
constexpr double kMinConvergence = 0.0005;
constexpr double kMaxConvergence = 0.02;
constexpr double kMinFit = 0.6;

double mean(const std::vector<double>& v, std::size_t from, std::size_t to){
    if (to <= from) return 0.0;
    return std::accumulate(v.begin() + from, v.begin() + to, 0.0) / double(to - from);
}

// Volume in the last 10 bars at least 10% below the 10 bars before.
bool volume_contracting(const core::Series& s, std::size_t from){
    if (!s.has_volume()) {
        if (s.volume_bars() > 0)
            spdlog::debug("triangle: volume on {} of {} bars, contraction not checked", s.volume_bars(), s.size());
        return false;
    }
    const auto vol = s.column(core::Column::Volume, from);
    if (vol.size() < 20) return false;
    const double recent  = mean(vol, vol.size() - 10, vol.size());
    const double earlier = mean(vol, vol.size() - 20, vol.size() - 10);
    return recent < earlier * 0.9;
}

} // namespace

std::optional<core::PatternInstance>
detect_triangle(const core::Series& s, const core::AnalysisConfig& cfg){
    if (s.size() < kTriangleBars) return std::nullopt;
    const std::size_t w = std::min(s.size(), std::max(cfg.lookback_window, kTriangleBars));
    const std::size_t base = s.size() - w;
    const auto highs  = s.column(core::Column::High, base);
    const auto lows   = s.column(core::Column::Low, base);
    const auto closes = s.column(core::Column::Close, base);

    const ind::ExtremaParams ep{cfg.prominence_tolerance, 3, 10};
    const auto peaks   = ind::find_extrema(highs, ep).peaks;
    const auto valleys = ind::find_extrema(lows, ep).valleys;
    if (peaks.size() < kTriangleTouches || valleys.size() < kTriangleTouches) return std::nullopt;

    std::vector<double> px, py, vx, vy;
    for (const auto& e : peaks)   { px.push_back(double(e.index)); py.push_back(e.price); }
    for (const auto& e : valleys) { vx.push_back(double(e.index)); vy.push_back(e.price); }
    const auto res = ind::fit_line(px, py);
    const auto sup = ind::fit_line(vx, vy);

    const double ref = mean(closes, 0, closes.size());
    if (ref <= 0.0) return std::nullopt;
    const double q_res = ind::fit_quality(res, ref, cfg.flat_slope, cfg.level_tolerance);
    const double q_sup = ind::fit_quality(sup, ref, cfg.flat_slope, cfg.level_tolerance);
    if (std::min(q_res, q_sup) < kMinFit) return std::nullopt;

    const double rs = res.slope / ref, ss = sup.slope / ref, flat = cfg.flat_slope;
    std::string name;
    if (std::abs(rs) < flat && ss > flat)       name = "Ascending Triangle";
    else if (rs < -flat && std::abs(ss) < flat) name = "Descending Triangle";
    else if (rs < -flat && ss > flat)           name = "Symmetrical Triangle";
    else return std::nullopt;

    const double conv  = ss - rs;
    const double angle = conv < kMinConvergence ? conv / kMinConvergence
                       : conv > kMaxConvergence ? kMaxConvergence / conv : 1.0;
    const bool vol_ok  = volume_contracting(s, base);

    const double last  = double(w - 1);
    const double upper = res.at(last), lower = sup.at(last);
    const double close = closes.back();

    core::PatternInstance p;
    p.pattern    = name;
    p.category   = core::Category::Continuation;
    p.confidence = core::clamp_confidence(35.0 + 30.0 * (q_res + q_sup) / 2.0
                                          + 15.0 * core::clamp01(angle) + (vol_ok ? 10.0 : 0.0));
    p.key_levels = {
        {"resistance", upper},
        {"support", lower},
        {"resistance_slope", res.slope},
        {"support_slope", sup.slope},
        {"resistance_r2", res.r_squared},
        {"support_r2", sup.r_squared},
    };

    if (name == "Ascending Triangle") {
        const std::size_t k = std::min<std::size_t>(3, peaks.size());
        double level = 0.0;
        for (std::size_t i = peaks.size() - k; i < peaks.size(); ++i) level += peaks[i].price;
        level /= double(k);
        p.key_levels["resistance"] = level;
        p.signal = close > level * (1.0 - cfg.approach_band) ? core::Signal::Buy : core::Signal::Hold;
        p.description = fmt::format("Ascending Triangle: bullish continuation, resistance at {:.2f}", level);
    } else if (name == "Descending Triangle") {
        const std::size_t k = std::min<std::size_t>(3, valleys.size());
        double level = 0.0;
        for (std::size_t i = valleys.size() - k; i < valleys.size(); ++i) level += valleys[i].price;
        level /= double(k);
        p.key_levels["support"] = level;
        p.signal = close < level * (1.0 + cfg.approach_band) ? core::Signal::Sell : core::Signal::Hold;
        p.description = fmt::format("Descending Triangle: bearish continuation, support at {:.2f}", level);
    } else {
        p.signal = close > upper ? core::Signal::Buy : close < lower ? core::Signal::Sell : core::Signal::Hold;
        p.description = fmt::format("Symmetrical Triangle: watch for a break above {:.2f} or below {:.2f}",
                                    upper, lower);
    }
    p.span = {base + std::min(peaks.front().index, valleys.front().index), s.size() - 1};
    return p;
}

std::optional<core::PatternInstance>
detect_flag_or_pennant(const core::Series& s, const core::AnalysisConfig& cfg){
    const std::size_t n = s.size();
    if (n < kFlagBars) return std::nullopt;
    const auto highs  = s.column(core::Column::High);
    const auto lows   = s.column(core::Column::Low);
    const auto closes = s.column(core::Column::Close);

    struct Pole { std::size_t start, top; double move; bool bull; };

    // pole top must leave 5..20 bars of consolidation behind it
    const std::size_t lo = n - 1 - kMaxConsolidation, hi = n - 1 - kMinConsolidation;
    std::optional<Pole> pole;
    for (bool bull : {true, false}) {
        std::size_t t = lo;
        for (std::size_t i = lo; i <= hi; ++i)
            if (bull ? highs[i] > highs[t] : lows[i] < lows[t]) t = i;
        if (t == 0) continue;
        const std::size_t from = t > kPoleWindow ? t - kPoleWindow : 0;
        std::size_t s0 = from;
        for (std::size_t i = from; i < t; ++i)
            if (bull ? lows[i] < lows[s0] : highs[i] > highs[s0]) s0 = i;
        const double move = bull ? core::safe_div(highs[t] - lows[s0], lows[s0])
                                 : core::safe_div(lows[t] - highs[s0], highs[s0]);
        if (std::abs(move) < cfg.min_pole_move) continue;
        if (!pole || std::abs(move) > std::abs(pole->move)) pole = Pole{s0, t, move, bull};
    }
    if (!pole) return std::nullopt;

    const std::size_t t = pole->top;
    const double c_hi = *std::max_element(highs.begin() + t + 1, highs.end());
    const double c_lo = *std::min_element(lows.begin() + t + 1, lows.end());
    const double range = core::safe_div(c_hi - c_lo, c_lo);
    if (range > cfg.max_flag_range) return std::nullopt;

    const double retrace = pole->bull
        ? core::safe_div(highs[t] - c_lo, highs[t] - lows[pole->start])
        : core::safe_div(c_hi - lows[t], highs[pole->start] - lows[t]);
    if (retrace > 0.5) return std::nullopt;

    std::vector<double> x, ch, cl;
    for (std::size_t i = t + 1; i < n; ++i) {
        x.push_back(double(i - t - 1));
        ch.push_back(highs[i]);
        cl.push_back(lows[i]);
    }
    const double ref = mean(closes, t + 1, n);
    if (ref <= 0.0) return std::nullopt;
    const double hs = ind::fit_line(x, ch).slope / ref;
    const double ls = ind::fit_line(x, cl).slope / ref;
    const double flat = cfg.flat_slope;

    const bool pennant = hs < -flat && ls > flat;
    const bool flag    = !pennant && std::abs(hs - ls) <= 2.0 * flat;
    if (!pennant && !flag) return std::nullopt;

    // the consolidation must drift slower than the pole climbed
    const double pole_rate = std::abs(pole->move) / double(std::max<std::size_t>(1, t - pole->start));
    if (std::abs(hs + ls) / 2.0 >= pole_rate) return std::nullopt;

    // breakout against the consolidation before the last bar
    double prior_hi = c_hi, prior_lo = c_lo;
    if (n - 1 > t + 1) {
        prior_hi = *std::max_element(highs.begin() + t + 1, highs.end() - 1);
        prior_lo = *std::min_element(lows.begin() + t + 1, lows.end() - 1);
    }
    const bool broken = pole->bull ? closes.back() > prior_hi : closes.back() < prior_lo;

    const double pole_score = core::clamp01((std::abs(pole->move) - cfg.min_pole_move) / (2.0 * cfg.min_pole_move));
    const double tightness  = core::clamp01(1.0 - range / cfg.max_flag_range);

    core::PatternInstance p;
    p.pattern    = fmt::format("{} {}", pole->bull ? "Bull" : "Bear", pennant ? "Pennant" : "Flag");
    p.category   = core::Category::Continuation;
    p.confidence = core::clamp_confidence(40.0 + 25.0 * pole_score + 20.0 * tightness + (broken ? 10.0 : 0.0));
    p.signal     = pole->bull ? core::Signal::Buy : core::Signal::Sell;
    const double level = pole->bull ? c_hi : c_lo;
    p.key_levels = {
        {"pole_move", pole->move * 100.0},
        {"consolidation_high", c_hi},
        {"consolidation_low", c_lo},
        {"breakout_level", level},
    };
    if (broken)
        p.description = fmt::format("{}: {} continuation after a {:.1f}% pole, broke {} {:.2f}",
                                    p.pattern, pole->bull ? "bullish" : "bearish", pole->move * 100.0,
                                    pole->bull ? "above" : "below", level);
    else
        p.description = fmt::format("{} forming after a {:.1f}% pole: watch for a break {} {:.2f}",
                                    p.pattern, pole->move * 100.0, pole->bull ? "above" : "below", level);
    p.span = {pole->start, n - 1};
    return p;
}

core::Instances ContinuationDetector::detect(const core::Series& s, const core::AnalysisConfig& cfg) const {
    core::Instances out;
    if (s.size() < min_bars()) return out;
    if (auto p = detect_triangle(s, cfg)) out.push_back(std::move(*p));
    if (auto p = detect_flag_or_pennant(s, cfg)) out.push_back(std::move(*p));
    return out;
}

} // namespace patterns
