#include "core/types.hpp"
#include <algorithm>

namespace core {

std::vector<double> Series::column(Column c, std::size_t from) const {
    std::vector<double> out;
    if (from >= points_.size()) return out;
    out.reserve(points_.size() - from);
    for (std::size_t i = from; i < points_.size(); ++i) {
        const auto& p = points_[i];
        switch (c) {
            case Column::Open:   out.push_back(p.open); break;
            case Column::High:   out.push_back(p.high); break;
            case Column::Low:    out.push_back(p.low); break;
            case Column::Close:  out.push_back(p.close); break;
            case Column::Volume: out.push_back(p.volume.value_or(0.0)); break;
        }
    }
    return out;
}

bool Series::has_volume() const {
    if (points_.empty()) return false;
    return std::all_of(points_.begin(), points_.end(),
                       [](const PricePoint& p) { return p.volume.has_value(); });
}

std::size_t Series::volume_bars() const {
    return std::size_t(std::count_if(points_.begin(), points_.end(),
                                     [](const PricePoint& p) { return p.volume.has_value(); }));
}

std::optional<Signal> signal_from_string(const std::string& s) {
    if (s == "BUY")  return Signal::Buy;
    if (s == "SELL") return Signal::Sell;
    if (s == "HOLD") return Signal::Hold;
    return std::nullopt;
}

std::optional<Category> category_from_string(const std::string& s) {
    for (auto c : kCategoryOrder)
        if (s == to_string(c)) return c;
    return std::nullopt;
}

bool operator==(const Span& a, const Span& b) {
    return a.first == b.first && a.last == b.last;
}

bool operator==(const PatternInstance& a, const PatternInstance& b) {
    return a.pattern == b.pattern && a.category == b.category
        && a.confidence == b.confidence && a.signal == b.signal
        && a.key_levels == b.key_levels && a.description == b.description
        && a.span == b.span;
}

} // namespace core
