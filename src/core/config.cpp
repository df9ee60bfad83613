#include "core/config.hpp"
#include "core/errors.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <set>

using json = nlohmann::json;

namespace core {

static double read_number(const json& j, const char* k, double def){
    if (!j.contains(k)) return def;
    if (!j[k].is_number()) throw ConfigError(fmt::format("'{}' must be a number", k));
    return j[k].get<double>();
}

static std::size_t read_count(const json& j, const char* k, std::size_t def){
    if (!j.contains(k)) return def;
    if (!j[k].is_number_integer() || j[k].get<long long>() < 0)
        throw ConfigError(fmt::format("'{}' must be a non-negative integer", k));
    return j[k].get<std::size_t>();
}

static void check_fraction(const char* k, double v){
    if (!(v > 0.0 && v < 1.0))
        throw ConfigError(fmt::format("'{}' must lie in (0, 1), got {}", k, v));
}

void validate(const AnalysisConfig& c){
    check_fraction("prominence_tolerance", c.prominence_tolerance);
    check_fraction("level_tolerance", c.level_tolerance);
    check_fraction("shoulder_tolerance", c.shoulder_tolerance);
    check_fraction("head_margin", c.head_margin);
    check_fraction("double_tolerance", c.double_tolerance);
    check_fraction("min_depth", c.min_depth);
    check_fraction("confirm_band", c.confirm_band);
    check_fraction("min_pole_move", c.min_pole_move);
    check_fraction("max_flag_range", c.max_flag_range);
    check_fraction("flat_slope", c.flat_slope);
    check_fraction("breakout_buffer", c.breakout_buffer);
    check_fraction("approach_band", c.approach_band);
    check_fraction("decisiveness_threshold", c.decisiveness_threshold);
    if (c.min_touches < 1) throw ConfigError("'min_touches' must be at least 1");
    if (c.extrema_distance < 1) throw ConfigError("'extrema_distance' must be at least 1");
    if (c.lookback_window < 10) throw ConfigError("'lookback_window' must be at least 10");
    if (c.top_n == 0) throw ConfigError("'top_n' must be positive");
    if (c.volume_multiplier <= 0.0) throw ConfigError("'volume_multiplier' must be positive");
    if (c.min_confidence < 0.0 || c.min_confidence > 100.0)
        throw ConfigError("'min_confidence' must lie in [0, 100]");
    for (const auto& [cat, w] : c.category_weights)
        if (w < 0.0) throw ConfigError(fmt::format("weight of '{}' is negative", to_string(cat)));
}

AnalysisConfig config_from_json(const json& j){
    if (!j.is_object()) throw ConfigError("configuration must be a JSON object");

    static const std::set<std::string> known{
        "prominence_tolerance", "level_tolerance", "min_touches", "extrema_distance",
        "lookback_window", "shoulder_tolerance", "head_margin", "double_tolerance",
        "min_depth", "confirm_band", "min_pole_move", "max_flag_range", "flat_slope",
        "breakout_buffer", "approach_band", "volume_multiplier", "category_weights",
        "decisiveness_threshold", "min_confidence", "top_n"};
    for (auto it = j.begin(); it != j.end(); ++it)
        if (!known.count(it.key())) spdlog::warn("config: ignoring unknown key '{}'", it.key());

    AnalysisConfig c;
    c.prominence_tolerance   = read_number(j, "prominence_tolerance", c.prominence_tolerance);
    c.level_tolerance        = read_number(j, "level_tolerance", c.level_tolerance);
    c.min_touches            = read_count(j, "min_touches", c.min_touches);
    c.extrema_distance       = read_count(j, "extrema_distance", c.extrema_distance);
    c.lookback_window        = read_count(j, "lookback_window", c.lookback_window);
    c.shoulder_tolerance     = read_number(j, "shoulder_tolerance", c.shoulder_tolerance);
    c.head_margin            = read_number(j, "head_margin", c.head_margin);
    c.double_tolerance       = read_number(j, "double_tolerance", c.double_tolerance);
    c.min_depth              = read_number(j, "min_depth", c.min_depth);
    c.confirm_band           = read_number(j, "confirm_band", c.confirm_band);
    c.min_pole_move          = read_number(j, "min_pole_move", c.min_pole_move);
    c.max_flag_range         = read_number(j, "max_flag_range", c.max_flag_range);
    c.flat_slope             = read_number(j, "flat_slope", c.flat_slope);
    c.breakout_buffer        = read_number(j, "breakout_buffer", c.breakout_buffer);
    c.approach_band          = read_number(j, "approach_band", c.approach_band);
    c.volume_multiplier      = read_number(j, "volume_multiplier", c.volume_multiplier);
    c.decisiveness_threshold = read_number(j, "decisiveness_threshold", c.decisiveness_threshold);
    c.min_confidence         = read_number(j, "min_confidence", c.min_confidence);
    c.top_n                  = read_count(j, "top_n", c.top_n);

    if (j.contains("category_weights")){
        const auto& w = j["category_weights"];
        if (!w.is_object()) throw ConfigError("'category_weights' must be an object");
        for (auto it = w.begin(); it != w.end(); ++it){
            auto cat = category_from_string(it.key());
            if (!cat) throw ConfigError(fmt::format("unknown category '{}'", it.key()));
            if (!it.value().is_number())
                throw ConfigError(fmt::format("weight of '{}' must be a number", it.key()));
            c.category_weights[*cat] = it.value().get<double>();
        }
    }

    validate(c);
    return c;
}

AnalysisConfig load_config(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw ConfigError(fmt::format("cannot open config file '{}'", path));
    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError(fmt::format("config file '{}': {}", path, e.what()));
    }
    return config_from_json(j);
}

json config_to_json(const AnalysisConfig& c){
    json w = json::object();
    for (const auto& [cat, v] : c.category_weights) w[to_string(cat)] = v;
    return {
        {"prominence_tolerance", c.prominence_tolerance},
        {"level_tolerance", c.level_tolerance},
        {"min_touches", c.min_touches},
        {"extrema_distance", c.extrema_distance},
        {"lookback_window", c.lookback_window},
        {"shoulder_tolerance", c.shoulder_tolerance},
        {"head_margin", c.head_margin},
        {"double_tolerance", c.double_tolerance},
        {"min_depth", c.min_depth},
        {"confirm_band", c.confirm_band},
        {"min_pole_move", c.min_pole_move},
        {"max_flag_range", c.max_flag_range},
        {"flat_slope", c.flat_slope},
        {"breakout_buffer", c.breakout_buffer},
        {"approach_band", c.approach_band},
        {"volume_multiplier", c.volume_multiplier},
        {"category_weights", w},
        {"decisiveness_threshold", c.decisiveness_threshold},
        {"min_confidence", c.min_confidence},
        {"top_n", c.top_n},
    };
}

} // namespace core
