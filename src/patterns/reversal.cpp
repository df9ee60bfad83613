#include "patterns/reversal.hpp"
#include "indicators/extrema.hpp"
#include "indicators/levels.hpp"
#include "indicators/trendline.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace patterns {

namespace {

constexpr std::size_t kHeadShouldersBars = 40;
constexpr std::size_t kDoubleBars = 30;

// Price arrays seen from the pattern's side. The bullish variants negate
// every value, so "peak", "above" and "closes below" keep a single meaning.
struct View {
    std::size_t base{0};        // series index of window bar 0
    double sign{1.0};
    std::vector<double> up;     // highs, or -lows
    std::vector<double> down;   // lows, or -highs
    double last_close{0.0};

    double price(double v) const { return sign * v; }
};

View make_view(const core::Series& s, const core::AnalysisConfig& cfg, bool mirrored){
    View v;
    const std::size_t w = std::min(s.size(), std::max(cfg.lookback_window, kHeadShouldersBars));
    v.base = s.size() - w;
    v.sign = mirrored ? -1.0 : 1.0;
    v.up   = s.column(mirrored ? core::Column::Low : core::Column::High, v.base);
    v.down = s.column(mirrored ? core::Column::High : core::Column::Low, v.base);
    for (auto& x : v.up) x *= v.sign;
    for (auto& x : v.down) x *= v.sign;
    v.last_close = v.sign * s.back().close;
    return v;
}

ind::ExtremaParams extrema_params(const core::AnalysisConfig& cfg){
    return {cfg.prominence_tolerance, cfg.extrema_distance, 10};
}

// lowest value strictly between a and b (b > a + 1)
std::size_t argmin_between(const std::vector<double>& v, std::size_t a, std::size_t b){
    std::size_t best = a + 1;
    for (std::size_t i = a + 1; i < b; ++i)
        if (v[i] < v[best]) best = i;
    return best;
}

} // namespace

std::optional<core::PatternInstance>
detect_head_and_shoulders(const core::Series& s, const core::AnalysisConfig& cfg, bool inverse){
    if (s.size() < kHeadShouldersBars) return std::nullopt;
    const View v = make_view(s, cfg, inverse);
    const auto peaks = ind::find_extrema(v.up, extrema_params(cfg)).peaks;
    if (peaks.size() < 3) return std::nullopt;

    // most recent triple first, among the last five peaks
    const std::size_t first = peaks.size() > 5 ? peaks.size() - 5 : 0;
    for (std::size_t k = peaks.size() - 2; k-- > first;) {
        const auto& L = peaks[k];
        const auto& H = peaks[k + 1];
        const auto& R = peaks[k + 2];

        const double shoulder = std::max(L.price, R.price);
        if (core::safe_div(H.price - shoulder, std::abs(shoulder)) < cfg.head_margin) continue;
        const double diff = core::safe_div(std::abs(L.price - R.price),
                                           std::max(std::abs(L.price), std::abs(R.price)));
        if (diff > cfg.shoulder_tolerance) continue;

        const std::size_t t1 = argmin_between(v.down, L.index, H.index);
        const std::size_t t2 = argmin_between(v.down, H.index, R.index);
        const auto neck = ind::fit_line({double(t1), double(t2)}, {v.down[t1], v.down[t2]});
        const double neck_last = neck.at(double(v.up.size() - 1));
        const bool confirmed = R.index + 1 < v.up.size() && v.last_close < neck_last;

        const double symmetry   = 1.0 - diff / cfg.shoulder_tolerance;
        const double prominence = core::safe_div(H.price - shoulder, std::abs(H.price));
        const double height     = H.price - neck.at(double(H.index));

        core::PatternInstance p;
        p.pattern    = inverse ? "Inverse Head and Shoulders" : "Head and Shoulders";
        p.category   = core::Category::Reversal;
        p.confidence = core::clamp_confidence(40.0 + 25.0 * symmetry
                                              + 20.0 * core::clamp01(prominence / 0.10)
                                              + (confirmed ? 15.0 : 0.0));
        p.signal     = !confirmed ? core::Signal::Hold : inverse ? core::Signal::Buy : core::Signal::Sell;
        p.key_levels = {
            {"left_shoulder", v.price(L.price)},
            {"head", v.price(H.price)},
            {"right_shoulder", v.price(R.price)},
            {"neckline", v.price(neck_last)},
            {"target", v.price(neck_last - height)},
        };
        if (confirmed)
            p.description = fmt::format("{}: {} reversal, head at {:.2f}, neckline broken at {:.2f}",
                                        p.pattern, inverse ? "bullish" : "bearish",
                                        v.price(H.price), v.price(neck_last));
        else
            p.description = fmt::format("{} forming: watch for a close {} the {:.2f} neckline",
                                        p.pattern, inverse ? "above" : "below", v.price(neck_last));
        p.span = {v.base + L.index, v.base + R.index};
        return p;
    }
    return std::nullopt;
}

std::optional<core::PatternInstance>
detect_double(const core::Series& s, const core::AnalysisConfig& cfg, bool bottom){
    if (s.size() < kDoubleBars) return std::nullopt;
    const View v = make_view(s, cfg, bottom);
    const auto peaks = ind::find_extrema(v.up, extrema_params(cfg)).peaks;
    if (peaks.size() < 2) return std::nullopt;

    // two-touch clusters are enough here
    const auto levels = ind::cluster_levels(peaks, bottom ? ind::LevelKind::Support : ind::LevelKind::Resistance,
                                            cfg.double_tolerance);

    struct Candidate { std::size_t a, b, trough; double depth, diff; };
    std::optional<Candidate> best;
    for (const auto& l : levels) {
        if (l.touch_count < 2) continue;
        for (std::size_t m = 0; m + 1 < l.indices.size(); ++m) {
            const std::size_t a = l.indices[m], b = l.indices[m + 1];
            const double top = std::max(v.up[a], v.up[b]);
            const double low = std::min(v.up[a], v.up[b]);
            if (*std::max_element(v.up.begin() + a + 1, v.up.begin() + b) > top) continue;

            const std::size_t t = argmin_between(v.down, a, b);
            const double depth = core::safe_div(low - v.down[t], std::abs(low));
            if (depth < cfg.min_depth) continue;
            const double diff = core::safe_div(top - low, std::max(std::abs(v.up[a]), std::abs(v.up[b])));
            if (diff > cfg.double_tolerance) continue;

            if (!best || b > best->b || (b == best->b && a > best->a))
                best = Candidate{a, b, t, depth, diff};
        }
    }
    if (!best) return std::nullopt;

    const double first   = v.up[best->a];
    const double second  = v.up[best->b];
    const double support = v.down[best->trough];
    const double avg     = (first + second) / 2.0;
    const bool confirmed = v.last_close < support + cfg.confirm_band * std::abs(support);

    core::PatternInstance p;
    p.pattern    = bottom ? "Double Bottom" : "Double Top";
    p.category   = core::Category::Reversal;
    p.confidence = core::clamp_confidence(35.0 + 25.0 * (1.0 - best->diff / cfg.double_tolerance)
                                          + 25.0 * core::clamp01(best->depth / 0.15)
                                          + (confirmed ? 15.0 : 0.0));
    p.signal     = !confirmed ? core::Signal::Hold : bottom ? core::Signal::Buy : core::Signal::Sell;
    if (bottom)
        p.key_levels = {
            {"first_valley", v.price(first)},
            {"second_valley", v.price(second)},
            {"resistance_level", v.price(support)},
        };
    else
        p.key_levels = {
            {"first_peak", v.price(first)},
            {"second_peak", v.price(second)},
            {"support_level", v.price(support)},
        };
    p.key_levels["target"] = v.price(support - (avg - support));

    if (confirmed)
        p.description = fmt::format("{}: {} reversal, {} at {:.2f} & {:.2f}, {} at {:.2f}",
                                    p.pattern, bottom ? "bullish" : "bearish",
                                    bottom ? "valleys" : "peaks", v.price(first), v.price(second),
                                    bottom ? "resistance" : "support", v.price(support));
    else
        p.description = fmt::format("{} forming: watch for a break {} {:.2f}",
                                    p.pattern, bottom ? "above" : "below", v.price(support));
    p.span = {v.base + best->a, v.base + best->b};
    return p;
}

core::Instances ReversalDetector::detect(const core::Series& s, const core::AnalysisConfig& cfg) const {
    core::Instances out;
    if (s.size() < min_bars()) return out;
    for (bool inverse : {false, true})
        if (auto p = detect_head_and_shoulders(s, cfg, inverse)) out.push_back(std::move(*p));
    for (bool bottom : {false, true})
        if (auto p = detect_double(s, cfg, bottom)) out.push_back(std::move(*p));
    return out;
}

} // namespace patterns
