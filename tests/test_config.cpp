#include <catch2/catch.hpp>
#include <cstdio>
#include <fstream>
#include "core/config.hpp"
#include "core/errors.hpp"

using namespace core;
using json = nlohmann::json;

TEST_CASE("Default configuration", "[config]") {
    AnalysisConfig c;
    CHECK_NOTHROW(validate(c));
    CHECK(c.weight(Category::Reversal) == 1.5);
    CHECK(c.weight(Category::Breakout) == 1.3);
    CHECK(c.weight(Category::Continuation) == 1.0);
    CHECK(c.weight(Category::Candlestick) == 0.8);
    CHECK(c.min_touches == 3);
    CHECK(c.lookback_window == 50);
    CHECK(c.top_n == 3);
}

TEST_CASE("Configuration from JSON", "[config]") {
    SECTION("missing keys keep defaults") {
        auto c = config_from_json(json::object());
        CHECK(c.prominence_tolerance == 0.02);
        CHECK(c.decisiveness_threshold == 0.10);
    }
    SECTION("recognised keys override") {
        auto c = config_from_json({
            {"prominence_tolerance", 0.03},
            {"level_tolerance", 0.025},
            {"min_touches", 2},
            {"lookback_window", 80},
            {"decisiveness_threshold", 0.2},
            {"category_weights", {{"candlestick", 0.5}}},
        });
        CHECK(c.prominence_tolerance == 0.03);
        CHECK(c.level_tolerance == 0.025);
        CHECK(c.min_touches == 2);
        CHECK(c.lookback_window == 80);
        CHECK(c.decisiveness_threshold == 0.2);
        CHECK(c.weight(Category::Candlestick) == 0.5);
        CHECK(c.weight(Category::Reversal) == 1.5);
    }
    SECTION("unknown keys are ignored") {
        CHECK_NOTHROW(config_from_json({{"colour", "blue"}}));
    }
    SECTION("round trip") {
        AnalysisConfig c;
        c.top_n = 5;
        c.category_weights[Category::Breakout] = 2.0;
        auto back = config_from_json(config_to_json(c));
        CHECK(back.top_n == 5);
        CHECK(back.weight(Category::Breakout) == 2.0);
        CHECK(config_to_json(back) == config_to_json(c));
    }
}

TEST_CASE("Configuration rejects bad values", "[config]") {
    CHECK_THROWS_AS(config_from_json(json::array()), ConfigError);
    CHECK_THROWS_AS(config_from_json({{"level_tolerance", "wide"}}), ConfigError);
    CHECK_THROWS_AS(config_from_json({{"prominence_tolerance", 1.5}}), ConfigError);
    CHECK_THROWS_AS(config_from_json({{"prominence_tolerance", 0.0}}), ConfigError);
    CHECK_THROWS_AS(config_from_json({{"min_touches", 0}}), ConfigError);
    CHECK_THROWS_AS(config_from_json({{"min_touches", -2}}), ConfigError);
    CHECK_THROWS_AS(config_from_json({{"min_touches", 2.5}}), ConfigError);
    CHECK_THROWS_AS(config_from_json({{"lookback_window", 5}}), ConfigError);
    CHECK_THROWS_AS(config_from_json({{"top_n", 0}}), ConfigError);
    CHECK_THROWS_AS(config_from_json({{"category_weights", {{"reversal", -1.0}}}}), ConfigError);
    CHECK_THROWS_AS(config_from_json({{"category_weights", {{"harmonic", 1.0}}}}), ConfigError);
    CHECK_THROWS_AS(config_from_json({{"category_weights", 3}}), ConfigError);
}

TEST_CASE("Configuration file loading", "[config]") {
    CHECK_THROWS_AS(load_config("/nonexistent/chartpat.json"), ConfigError);

    const std::string path = "chartpat_test_config.json";
    {
        std::ofstream f(path);
        f << R"({"min_touches": 4, "category_weights": {"breakout": 1.0}})";
    }
    auto c = load_config(path);
    CHECK(c.min_touches == 4);
    CHECK(c.weight(Category::Breakout) == 1.0);

    {
        std::ofstream f(path);
        f << "{ not json";
    }
    CHECK_THROWS_AS(load_config(path), ConfigError);
    std::remove(path.c_str());
}
