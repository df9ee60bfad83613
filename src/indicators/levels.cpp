#include "indicators/levels.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace ind {

std::vector<Level> cluster_levels(const std::vector<Extremum>& extrema, LevelKind kind, double tolerance){
    std::vector<Extremum> sorted(extrema);
    std::sort(sorted.begin(), sorted.end(), [](const Extremum& a, const Extremum& b){
        return a.price < b.price || (a.price == b.price && a.index < b.index);
    });

    std::vector<Level> levels;
    double sum = 0.0;
    for (const auto& e : sorted) {
        if (!levels.empty()) {
            auto& cur = levels.back();
            const double mean = sum / static_cast<double>(cur.touch_count);
            if (std::abs(mean) > 0.0 && std::abs(e.price - mean) / std::abs(mean) <= tolerance) {
                sum += e.price;
                ++cur.touch_count;
                cur.price = sum / static_cast<double>(cur.touch_count);
                cur.indices.push_back(e.index);
                continue;
            }
        }
        levels.push_back({e.price, 1, kind, {e.index}});
        sum = e.price;
    }
    for (auto& l : levels) std::sort(l.indices.begin(), l.indices.end());
    return levels;
}

std::vector<Level> filter_levels(const std::vector<Level>& levels, std::size_t min_touches){
    std::vector<Level> out;
    std::copy_if(levels.begin(), levels.end(), std::back_inserter(out),
                 [min_touches](const Level& l){ return l.touch_count >= min_touches; });
    return out;
}

} // namespace ind
