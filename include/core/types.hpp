#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace core {

// OHLCV bar
struct PricePoint {
    std::int64_t timestamp_ms{}; // bar open time (ms)
    double open{};
    double high{};
    double low{};
    double close{};
    std::optional<double> volume{};
};

enum class Column { Open, High, Low, Close, Volume };

// Time-ordered, immutable price history of one instrument.
class Series {
public:
    Series() = default;
    explicit Series(std::vector<PricePoint> points) : points_(std::move(points)) {}

    std::size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    const PricePoint& operator[](std::size_t i) const { return points_[i]; }
    const PricePoint& back() const { return points_.back(); }

    auto begin() const { return points_.begin(); }
    auto end() const { return points_.end(); }

    // Values of one column from index `from` to the end. Missing volume reads as 0.
    std::vector<double> column(Column c, std::size_t from = 0) const;

    // True only when every bar carries a volume.
    bool has_volume() const;
    std::size_t volume_bars() const;

private:
    std::vector<PricePoint> points_;
};

// Trading signal
enum class Signal { Buy, Sell, Hold };

enum class Category { Reversal, Continuation, Breakout, Candlestick };

inline const char* to_string(Signal s) {
    switch (s) {
        case Signal::Buy:  return "BUY";
        case Signal::Sell: return "SELL";
        default:           return "HOLD";
    }
}

inline const char* to_string(Category c) {
    switch (c) {
        case Category::Reversal:     return "reversal";
        case Category::Continuation: return "continuation";
        case Category::Breakout:     return "breakout";
        default:                     return "candlestick";
    }
}

// Reverse of to_string; nullopt for unknown names.
std::optional<Signal> signal_from_string(const std::string& s);
std::optional<Category> category_from_string(const std::string& s);

// Detection order, also the tie-break priority when ranking.
constexpr Category kCategoryOrder[] = {
    Category::Reversal, Category::Continuation, Category::Breakout, Category::Candlestick};

// Index range [first, last] in the analysed series.
struct Span {
    std::size_t first{0};
    std::size_t last{0};
};

// One detected pattern. Built once by a detector, read-only afterwards.
struct PatternInstance {
    std::string pattern;
    Category category{Category::Candlestick};
    double confidence{0.0};      // 0..100
    Signal signal{Signal::Hold};
    std::map<std::string, double> key_levels;
    std::string description;
    Span span;
};

bool operator==(const Span& a, const Span& b);
bool operator==(const PatternInstance& a, const PatternInstance& b);
inline bool operator!=(const PatternInstance& a, const PatternInstance& b) { return !(a == b); }

} // namespace core
