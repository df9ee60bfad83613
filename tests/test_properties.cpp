#include <catch2/catch.hpp>
#include <algorithm>
#include <cmath>
#include <random>
#include "strategy/analyzer.hpp"
#include "series_builder.hpp"

using namespace core;

namespace {

const std::vector<std::size_t> kLengths{0, 1, 2, 3, 4, 29, 30, 31, 39, 40, 41, 49, 50, 51, 80, 150};

std::vector<PricePoint> random_walk(std::mt19937& rng, std::size_t n, double vol, bool with_volume){
    std::normal_distribution<double> step(0.0, vol);
    std::uniform_real_distribution<double> wick(0.0, 0.01);
    std::uniform_real_distribution<double> shares(100.0, 5000.0);
    std::vector<PricePoint> out;
    double prev = 100.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double close = std::max(0.01, prev * (1.0 + step(rng)));
        PricePoint p{std::int64_t(i) * testutil::kDayMs, prev, 0.0, 0.0, close, std::nullopt};
        p.high = std::max(p.open, close) * (1.0 + wick(rng));
        p.low  = std::min(p.open, close) * (1.0 - wick(rng));
        if (with_volume) p.volume = shares(rng);
        out.push_back(p);
        prev = close;
    }
    return out;
}

std::vector<PricePoint> near_flat(std::mt19937& rng, std::size_t n){
    std::uniform_real_distribution<double> jitter(-1e-9, 1e-9);
    std::vector<PricePoint> out;
    for (std::size_t i = 0; i < n; ++i) {
        const double v = 100.0 + jitter(rng);
        out.push_back(testutil::bar(i, v, v + 1e-9, v - 1e-9, v));
    }
    return out;
}

std::vector<PricePoint> zero_price(std::size_t n){
    std::vector<PricePoint> out;
    for (std::size_t i = 0; i < n; ++i) {
        auto b = testutil::flat_bar(i, 0.0);
        b.volume = 0.0;
        out.push_back(b);
    }
    return out;
}

std::vector<Series> generated(){
    std::mt19937 rng(20240611u);
    std::vector<Series> out;
    for (auto n : kLengths) {
        out.emplace_back(random_walk(rng, n, 0.02, true));
        out.emplace_back(random_walk(rng, n, 0.05, false));
        out.emplace_back(near_flat(rng, n));
        out.emplace_back(zero_price(n));
        std::vector<PricePoint> flat;
        for (std::size_t i = 0; i < n; ++i) flat.push_back(testutil::flat_bar(i, 100.0));
        out.emplace_back(flat);
    }
    out.push_back(testutil::series(testutil::waypoints({90, 100, 90, 120, 90, 101, 85}, 8)));
    out.push_back(testutil::series(testutil::waypoints({300, 315, 300, 315, 300, 315, 300, 315, 300, 320}, 6)));
    return out;
}

} // namespace

TEST_CASE("Every instance confidence lies in [0, 100]", "[properties]") {
    const auto detectors = strategy::default_detectors();
    std::size_t checked = 0;

    for (const auto& s : generated()) {
        std::vector<std::string> skipped;
        const auto found = strategy::run_detectors(detectors, s, AnalysisConfig{}, skipped);
        CHECK(skipped.empty());
        for (const auto& p : found) {
            INFO(p.pattern << " over " << s.size() << " bars");
            CHECK(std::isfinite(p.confidence));
            CHECK(p.confidence >= 0.0);
            CHECK(p.confidence <= 100.0);
            CHECK(p.span.first <= p.span.last);
            CHECK(p.span.last < s.size());
            ++checked;
        }

        const auto r = strategy::analyze("GEN", s);
        CHECK(r.overall_confidence >= 0.0);
        CHECK(r.overall_confidence <= 100.0);
    }
    CHECK(checked > 0);
}
