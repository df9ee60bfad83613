#include <catch2/catch.hpp>
#include "patterns/candlestick.hpp"
#include "series_builder.hpp"

using namespace core;
using patterns::CandlestickDetector;
using testutil::bar;

namespace {

// small-bodied opener that takes part in no pattern
const PricePoint kQuiet = bar(0, 104, 105, 103.5, 104.5);

Instances detect3(PricePoint b1, PricePoint b2){
    b1.timestamp_ms = testutil::kDayMs;
    b2.timestamp_ms = 2 * testutil::kDayMs;
    return CandlestickDetector{}.detect(testutil::series({kQuiet, b1, b2}), AnalysisConfig{});
}

} // namespace

TEST_CASE("Candle anatomy", "[candlestick]") {
    const patterns::Candle c(bar(0, 100, 101.2, 95, 101));
    CHECK(c.range() == Approx(6.2));
    CHECK(c.body() == Approx(1.0));
    CHECK(c.upper_wick() == Approx(0.2));
    CHECK(c.lower_wick() == Approx(5.0));
    CHECK(c.bullish());
    CHECK_FALSE(c.bearish());
}

TEST_CASE("Hammer after a lower close", "[candlestick]") {
    const auto found = detect3(bar(0, 104, 104.5, 102.5, 103), bar(0, 100, 101.2, 95, 101));
    REQUIRE(found.size() == 1);
    CHECK(found[0].pattern == "Hammer");
    CHECK(found[0].signal == Signal::Buy);
    CHECK(found[0].category == Category::Candlestick);
    CHECK(found[0].confidence == Approx(70.0));
    CHECK(found[0].span.first == 2);
    CHECK(found[0].span.last == 2);
}

TEST_CASE("Hanging Man after a higher close", "[candlestick]") {
    const auto found = detect3(bar(0, 95, 96.5, 94.5, 96), bar(0, 100, 101.2, 95, 101));
    REQUIRE(found.size() == 1);
    CHECK(found[0].pattern == "Hanging Man");
    CHECK(found[0].signal == Signal::Sell);
    CHECK(found[0].confidence == Approx(65.0));
}

TEST_CASE("Doji", "[candlestick]") {
    const auto found = detect3(bar(0, 99, 100, 98.8, 99.5), bar(0, 100, 102, 98, 100.05));
    REQUIRE(found.size() == 1);
    CHECK(found[0].pattern == "Doji");
    CHECK(found[0].signal == Signal::Hold);
    CHECK(found[0].confidence == Approx(30.0 + 30.0 * (1.0 - 0.05 / 4.0)));
}

TEST_CASE("Bullish and Bearish Engulfing", "[candlestick]") {
    const auto bull = detect3(bar(0, 105, 106, 99, 100), bar(0, 99, 108, 98.5, 107));
    REQUIRE(bull.size() == 1);
    CHECK(bull[0].pattern == "Bullish Engulfing");
    CHECK(bull[0].signal == Signal::Buy);
    CHECK(bull[0].confidence == Approx(65.0));
    CHECK(bull[0].span.first == 1);
    CHECK(bull[0].span.last == 2);

    const auto bear = detect3(bar(0, 100, 106, 99, 105), bar(0, 106, 106.5, 97, 98));
    REQUIRE(bear.size() == 1);
    CHECK(bear[0].pattern == "Bearish Engulfing");
    CHECK(bear[0].signal == Signal::Sell);
    CHECK(bear[0].confidence == Approx(50.0 + 25.0 * (8.0 / 5.0 - 1.0)));
}

TEST_CASE("Piercing Line and Dark Cloud Cover", "[candlestick]") {
    // gap below 100, close 103.5 is 70% back into the 100-105 body
    const auto pierce = detect3(bar(0, 105, 105.5, 99.5, 100), bar(0, 99, 104, 98.5, 103.5));
    REQUIRE(pierce.size() == 1);
    CHECK(pierce[0].pattern == "Piercing Line");
    CHECK(pierce[0].signal == Signal::Buy);
    CHECK(pierce[0].confidence == Approx(40.0 + 40.0 * 0.7));

    const auto cloud = detect3(bar(0, 100, 105.5, 99.5, 105), bar(0, 106, 106.5, 101, 101.5));
    REQUIRE(cloud.size() == 1);
    CHECK(cloud[0].pattern == "Dark Cloud Cover");
    CHECK(cloud[0].signal == Signal::Sell);
    CHECK(cloud[0].confidence == Approx(40.0 + 40.0 * 0.7));
}

TEST_CASE("Morning and Evening Star", "[candlestick]") {
    const auto morning = CandlestickDetector{}.detect(testutil::series({
        bar(0, 110, 111, 99, 100), bar(1, 98, 99, 97, 98.5), bar(2, 99, 109, 98.5, 108)}), AnalysisConfig{});
    REQUIRE(morning.size() == 1);
    CHECK(morning[0].pattern == "Morning Star");
    CHECK(morning[0].signal == Signal::Buy);
    CHECK(morning[0].confidence == Approx(65.0 + 10.0 * (1.0 - 0.05 / 0.3) + 10.0));
    CHECK(morning[0].span.first == 0);
    CHECK(morning[0].span.last == 2);

    const auto evening = CandlestickDetector{}.detect(testutil::series({
        bar(0, 100, 111, 99, 110), bar(1, 112, 113, 111, 111.5), bar(2, 111, 111.5, 101, 102)}), AnalysisConfig{});
    REQUIRE(evening.size() == 1);
    CHECK(evening[0].pattern == "Evening Star");
    CHECK(evening[0].signal == Signal::Sell);
}

TEST_CASE("Degenerate candles never match", "[candlestick]") {
    const auto flat = testutil::series({testutil::flat_bar(0, 100), testutil::flat_bar(1, 100),
                                        testutil::flat_bar(2, 100)});
    CHECK(CandlestickDetector{}.detect(flat, AnalysisConfig{}).empty());

    const auto two = testutil::series({bar(0, 105, 106, 99, 100), bar(1, 99, 108, 98.5, 107)});
    CHECK(CandlestickDetector{}.detect(two, AnalysisConfig{}).empty());
}
