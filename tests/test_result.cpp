#include <catch2/catch.hpp>
#include "core/errors.hpp"
#include "report/result.hpp"
#include "strategy/analyzer.hpp"
#include "series_builder.hpp"

using namespace core;
using json = nlohmann::json;

namespace {

report::AnalysisResult sample(){
    report::AnalysisResult r;
    r.instrument_id = "RELIANCE";
    r.overall_signal = Signal::Buy;
    r.overall_confidence = 73.4;
    r.patterns_detected = 4;

    PatternInstance p;
    p.pattern = "Double Bottom";
    p.category = Category::Reversal;
    p.confidence = 88.123456789;
    p.signal = Signal::Buy;
    p.key_levels = {{"first_valley", 90.0}, {"second_valley", 90.25}, {"resistance_level", 105.0}};
    p.description = "Double Bottom: bullish reversal";
    p.span = {8, 24};
    r.top_patterns.push_back(p);

    p.pattern = "Hammer";
    p.category = Category::Candlestick;
    p.confidence = 70.0;
    p.key_levels = {{"low", 95.0}};
    p.span = {40, 40};
    r.top_patterns.push_back(p);

    r.category_summary[Category::Reversal] = {2, Signal::Buy};
    r.category_summary[Category::Candlestick] = {2, Signal::Hold};
    r.skipped = {"breakout: boom"};
    r.summary = report::summarize(r);
    return r;
}

} // namespace

TEST_CASE("Result JSON shape", "[result]") {
    const auto j = report::to_json(sample());

    CHECK(j.at("instrument_id") == "RELIANCE");
    CHECK(j.at("overall_signal") == "BUY");
    CHECK(j.at("patterns_detected") == 4);
    REQUIRE(j.at("top_patterns").size() == 2);
    const auto& top = j.at("top_patterns")[0];
    CHECK(top.at("pattern") == "Double Bottom");
    CHECK(top.at("category") == "reversal");
    CHECK(top.at("signal") == "BUY");
    CHECK(top.at("key_levels").at("resistance_level") == 105.0);
    CHECK(top.at("span") == json::array({8, 24}));
    CHECK(j.at("category_summary").at("candlestick").at("dominant_signal") == "HOLD");
    CHECK(j.at("skipped") == json::array({"breakout: boom"}));
}

TEST_CASE("Result JSON round trip", "[result]") {
    const auto r = sample();
    CHECK(report::from_json(report::to_json(r)) == r);
    CHECK(report::from_json(json::parse(report::to_json(r).dump())) == r);

    const auto analysed = strategy::analyze("HS",
        testutil::series(testutil::waypoints({90, 100, 90, 120, 90, 101, 85}, 8)));
    CHECK(report::from_json(json::parse(report::to_json(analysed).dump())) == analysed);
}

TEST_CASE("Malformed result JSON", "[result]") {
    auto j = report::to_json(sample());

    auto missing = j;
    missing.erase("overall_signal");
    CHECK_THROWS_AS(report::from_json(missing), ResultFormatError);

    auto bad_signal = j;
    bad_signal["overall_signal"] = "MAYBE";
    CHECK_THROWS_AS(report::from_json(bad_signal), ResultFormatError);

    auto bad_category = j;
    bad_category["top_patterns"][0]["category"] = "harmonic";
    CHECK_THROWS_AS(report::from_json(bad_category), ResultFormatError);

    auto bad_span = j;
    bad_span["top_patterns"][0]["span"] = json::array({1});
    CHECK_THROWS_AS(report::from_json(bad_span), ResultFormatError);

    auto wrong_type = j;
    wrong_type["overall_confidence"] = "high";
    CHECK_THROWS_AS(report::from_json(wrong_type), ResultFormatError);
}

TEST_CASE("Summary line", "[result]") {
    CHECK(sample().summary ==
          "RELIANCE: BUY 73% | Primary: Double Bottom (88%) | Bullish signals dominate | Additional patterns: 1");

    report::AnalysisResult none;
    none.instrument_id = "FLAT";
    CHECK(report::summarize(none) == "FLAT: HOLD 0% | No significant patterns detected");
}

TEST_CASE("Pattern explanations", "[result]") {
    CHECK_FALSE(report::explain("Head and Shoulders").empty());
    CHECK_FALSE(report::explain("Morning Star").empty());
    CHECK(report::explain("Cup and Handle").empty());
}
