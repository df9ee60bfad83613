#pragma once
#include <utility>
#include <vector>
#include "core/types.hpp"

namespace testutil {

constexpr std::int64_t kDayMs = 86'400'000;

inline core::PricePoint flat_bar(std::size_t i, double v){
    return {std::int64_t(i) * kDayMs, v, v, v, v, std::nullopt};
}

inline core::PricePoint bar(std::size_t i, double o, double h, double l, double c){
    return {std::int64_t(i) * kDayMs, o, h, l, c, std::nullopt};
}

// Piecewise-linear path: starts at `start`, then walks to each target in
// the given number of bars. Every bar has open = high = low = close.
inline std::vector<core::PricePoint> segments(double start,
                                              const std::vector<std::pair<double, std::size_t>>& legs){
    std::vector<core::PricePoint> out{flat_bar(0, start)};
    double from = start;
    for (const auto& [to, steps] : legs) {
        for (std::size_t k = 1; k <= steps; ++k)
            out.push_back(flat_bar(out.size(), from + (to - from) * double(k) / double(steps)));
        from = to;
    }
    return out;
}

// Same, with `steps` bars between consecutive waypoints.
inline std::vector<core::PricePoint> waypoints(const std::vector<double>& w, std::size_t steps){
    std::vector<std::pair<double, std::size_t>> legs;
    for (std::size_t i = 1; i < w.size(); ++i) legs.push_back({w[i], steps});
    return segments(w.front(), legs);
}

inline core::Series series(std::vector<core::PricePoint> p){ return core::Series(std::move(p)); }

inline std::vector<double> closes(const std::vector<double>& w, std::size_t steps){
    std::vector<double> out;
    for (const auto& p : waypoints(w, steps)) out.push_back(p.close);
    return out;
}

} // namespace testutil
