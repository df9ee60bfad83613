#include "indicators/extrema.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

namespace {

// sign = +1 for peaks, -1 for valleys; comparisons run on sign*v
bool dominates(const std::vector<double>& v, std::size_t i, std::size_t d, double sign){
    const double x = sign * v[i];
    const std::size_t lo = i >= d ? i - d : 0;
    const std::size_t hi = std::min(v.size() - 1, i + d);
    for (std::size_t j = lo; j < i; ++j)
        if (!(x > sign * v[j])) return false;
    for (std::size_t j = i + 1; j <= hi; ++j)
        if (!(x >= sign * v[j])) return false;
    return true;
}

double prominence(const std::vector<double>& v, std::size_t i, double sign){
    const double x = sign * v[i];

    double left_min = x;
    for (std::size_t j = i; j-- > 0;) {
        const double y = sign * v[j];
        if (y > x) break;
        left_min = std::min(left_min, y);
    }
    double right_min = x;
    for (std::size_t j = i + 1; j < v.size(); ++j) {
        const double y = sign * v[j];
        if (y > x) break;
        right_min = std::min(right_min, y);
    }
    return x - std::max(left_min, right_min);
}

} // namespace

Extrema find_extrema(const std::vector<double>& v, const ExtremaParams& p){
    Extrema out;
    if (v.size() < std::max<std::size_t>(p.min_length, 3)) return out;

    const auto [mn, mx] = std::minmax_element(v.begin(), v.end());
    const double range = *mx - *mn;
    if (!(range > 0.0) || !std::isfinite(range)) return out;
    const double threshold = p.prominence * range;
    const std::size_t d = std::max<std::size_t>(p.distance, 1);

    for (std::size_t i = 1; i + 1 < v.size(); ++i) {
        if (dominates(v, i, d, 1.0)) {
            const double prom = prominence(v, i, 1.0);
            if (prom > threshold) out.peaks.push_back({i, v[i], ExtremumKind::Peak, prom});
        } else if (dominates(v, i, d, -1.0)) {
            const double prom = prominence(v, i, -1.0);
            if (prom > threshold) out.valleys.push_back({i, v[i], ExtremumKind::Valley, prom});
        }
    }
    return out;
}

Extrema find_extrema(const core::Series& s, core::Column c, const ExtremaParams& p, std::size_t from){
    return find_extrema(s.column(c, from), p);
}

} // namespace ind
