#pragma once
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace core {

// Analysis settings. Passed by const reference into every call; never global.
struct AnalysisConfig {
    // extrema / levels
    double prominence_tolerance{0.02};   // fraction of the column range
    double level_tolerance{0.02};        // relative distance to a level mean
    std::size_t min_touches{3};
    std::size_t extrema_distance{5};     // bars on each side a peak must dominate
    std::size_t lookback_window{50};

    // reversal
    double shoulder_tolerance{0.05};
    double head_margin{0.02};
    double double_tolerance{0.03};
    double min_depth{0.05};
    double confirm_band{0.02};

    // continuation
    double min_pole_move{0.10};
    double max_flag_range{0.08};
    double flat_slope{0.001};            // fraction of price per bar

    // breakout
    double breakout_buffer{0.005};
    double approach_band{0.02};
    double volume_multiplier{1.5};

    // aggregation
    std::map<Category, double> category_weights{
        {Category::Reversal, 1.5},
        {Category::Continuation, 1.0},
        {Category::Breakout, 1.3},
        {Category::Candlestick, 0.8},
    };
    double decisiveness_threshold{0.10};
    double min_confidence{20.0};
    std::size_t top_n{3};

    double weight(Category c) const {
        auto it = category_weights.find(c);
        return it == category_weights.end() ? 1.0 : it->second;
    }
};

// Missing keys keep their defaults. Throws ConfigError on bad types or ranges.
AnalysisConfig config_from_json(const nlohmann::json& j);
AnalysisConfig load_config(const std::string& path);

nlohmann::json config_to_json(const AnalysisConfig& cfg);

// Throws ConfigError when a value is out of range.
void validate(const AnalysisConfig& cfg);

} // namespace core
