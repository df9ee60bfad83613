#pragma once
#include <vector>

namespace ind {

// Least-squares line y = slope*x + intercept.
struct Trendline {
    double slope{0.0};
    double intercept{0.0};
    double r_squared{0.0};
    double rmse{0.0};
    std::size_t points{0};

    double at(double x) const { return slope * x + intercept; }
};

// Fewer than two points, or no spread in x, gives an all-zero line.
// A perfectly constant y reports r_squared = 1.
Trendline fit_line(const std::vector<double>& x, const std::vector<double>& y);

// Fit quality in 0..1. Sloped lines use R²; a line flatter than `flat_slope`
// (fraction of `ref_price` per bar) has no variance to explain, so its
// quality is 1 - (rmse / ref_price) / tolerance instead.
double fit_quality(const Trendline& t, double ref_price, double flat_slope, double tolerance);

} // namespace ind
