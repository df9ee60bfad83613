#include "indicators/trendline.hpp"
#include "core/detector.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

Trendline fit_line(const std::vector<double>& x, const std::vector<double>& y){
    Trendline t;
    const std::size_t n = std::min(x.size(), y.size());
    if (n < 2) return t;

    double mx = 0.0, my = 0.0;
    for (std::size_t i = 0; i < n; ++i){ mx += x[i]; my += y[i]; }
    mx /= n; my /= n;

    double sxx = 0.0, sxy = 0.0, syy = 0.0;
    for (std::size_t i = 0; i < n; ++i){
        const double dx = x[i] - mx, dy = y[i] - my;
        sxx += dx*dx; sxy += dx*dy; syy += dy*dy;
    }
    if (sxx <= 1e-12) return t;

    t.points    = n;
    t.slope     = sxy / sxx;
    t.intercept = my - t.slope * mx;

    double sse = 0.0;
    for (std::size_t i = 0; i < n; ++i){ const double r = y[i] - t.at(x[i]); sse += r*r; }
    t.rmse      = std::sqrt(sse / n);
    t.r_squared = (syy <= 1e-12 ? 1.0 : core::clamp01(1.0 - sse / syy));
    return t;
}

double fit_quality(const Trendline& t, double ref_price, double flat_slope, double tolerance){
    if (t.points < 2 || ref_price <= 0.0) return 0.0;
    if (std::abs(t.slope / ref_price) < flat_slope)
        return core::clamp01(1.0 - core::safe_div(t.rmse / ref_price, tolerance));
    return t.r_squared;
}

} // namespace ind
