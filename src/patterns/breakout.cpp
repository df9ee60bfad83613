#include "patterns/breakout.hpp"
#include "indicators/extrema.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <numeric>

namespace patterns {

namespace {

constexpr std::size_t kVolumeWindow = 20;
constexpr std::size_t kMaxTouchBonus = 6;

double touches_of(const ind::Level& l){
    return double(std::min(l.touch_count, kMaxTouchBonus));
}

core::PatternInstance make_instance(const std::string& name, core::Signal sig, double confidence,
                                    const char* level_key, const ind::Level& l, std::size_t base,
                                    std::size_t last){
    core::PatternInstance p;
    p.pattern    = name;
    p.category   = core::Category::Breakout;
    p.confidence = core::clamp_confidence(confidence);
    p.signal     = sig;
    p.key_levels = {
        {level_key, l.price},
        {"touches", double(l.touch_count)},
    };
    p.span = {base + l.indices.front(), last};
    return p;
}

} // namespace

LevelSet find_levels(const core::Series& s, const core::AnalysisConfig& cfg){
    LevelSet out;
    const std::size_t w = std::min(s.size(), cfg.lookback_window);
    out.base = s.size() - w;
    const ind::ExtremaParams ep{cfg.prominence_tolerance, cfg.extrema_distance, 10};
    const auto peaks   = ind::find_extrema(s, core::Column::High, ep, out.base).peaks;
    const auto valleys = ind::find_extrema(s, core::Column::Low, ep, out.base).valleys;
    out.resistance = ind::filter_levels(
        ind::cluster_levels(peaks, ind::LevelKind::Resistance, cfg.level_tolerance), cfg.min_touches);
    out.support = ind::filter_levels(
        ind::cluster_levels(valleys, ind::LevelKind::Support, cfg.level_tolerance), cfg.min_touches);
    return out;
}

double volume_ratio(const core::Series& s){
    if (!s.has_volume()) {
        if (s.volume_bars() > 0)
            spdlog::debug("breakout: volume on {} of {} bars, no confirmation", s.volume_bars(), s.size());
        return 0.0;
    }
    if (s.size() < kVolumeWindow + 1) return 0.0;
    const auto vol = s.column(core::Column::Volume, s.size() - kVolumeWindow - 1);
    const double avg = std::accumulate(vol.begin(), vol.end() - 1, 0.0) / double(kVolumeWindow);
    return core::safe_div(vol.back(), avg);
}

core::Instances BreakoutDetector::detect(const core::Series& s, const core::AnalysisConfig& cfg) const {
    core::Instances out;
    if (s.size() < min_bars()) return out;

    const LevelSet levels = find_levels(s, cfg);
    const double close = s.back().close;
    const std::size_t last = s.size() - 1;
    const double vr = volume_ratio(s);
    const bool vol_ok = vr >= cfg.volume_multiplier;

    // levels come back ordered by price
    const ind::Level* broken_res = nullptr;
    for (const auto& l : levels.resistance)
        if (close > l.price * (1.0 + cfg.breakout_buffer)) broken_res = &l;
    const ind::Level* broken_sup = nullptr;
    for (auto it = levels.support.rbegin(); it != levels.support.rend(); ++it)
        if (close < it->price * (1.0 - cfg.breakout_buffer)) broken_sup = &*it;

    if (broken_res) {
        auto p = make_instance("Resistance Breakout", core::Signal::Buy,
                               45.0 + 7.5 * touches_of(*broken_res) + (vol_ok ? 10.0 : 0.0),
                               "resistance_level", *broken_res, levels.base, last);
        if (s.has_volume()) p.key_levels["volume_ratio"] = vr;
        p.description = fmt::format("Resistance Breakout: close {:.2f} above {:.2f} ({} touches){}",
                                    close, broken_res->price, broken_res->touch_count,
                                    vol_ok ? " on rising volume" : "");
        out.push_back(std::move(p));
    }
    if (broken_sup) {
        auto p = make_instance("Support Breakdown", core::Signal::Sell,
                               45.0 + 7.5 * touches_of(*broken_sup) + (vol_ok ? 10.0 : 0.0),
                               "support_level", *broken_sup, levels.base, last);
        if (s.has_volume()) p.key_levels["volume_ratio"] = vr;
        p.description = fmt::format("Support Breakdown: close {:.2f} below {:.2f} ({} touches){}",
                                    close, broken_sup->price, broken_sup->touch_count,
                                    vol_ok ? " on rising volume" : "");
        out.push_back(std::move(p));
    }
    if (!out.empty()) return out;

    // nearest uncrossed level on each side
    for (const auto& l : levels.resistance) {
        if (close > l.price * (1.0 + cfg.breakout_buffer)) continue;
        if (close < l.price * (1.0 - cfg.approach_band)) continue;
        auto p = make_instance("Approaching Resistance", core::Signal::Hold,
                               30.0 + 5.0 * touches_of(l), "resistance_level", l, levels.base, last);
        p.description = fmt::format("Approaching Resistance at {:.2f} ({} touches)", l.price, l.touch_count);
        out.push_back(std::move(p));
        break;
    }
    for (auto it = levels.support.rbegin(); it != levels.support.rend(); ++it) {
        if (close < it->price * (1.0 - cfg.breakout_buffer)) continue;
        if (close > it->price * (1.0 + cfg.approach_band)) continue;
        auto p = make_instance("Approaching Support", core::Signal::Hold,
                               30.0 + 5.0 * touches_of(*it), "support_level", *it, levels.base, last);
        p.description = fmt::format("Approaching Support at {:.2f} ({} touches)", it->price, it->touch_count);
        out.push_back(std::move(p));
        break;
    }
    return out;
}

} // namespace patterns
