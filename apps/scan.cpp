#include <cctype>
#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <string>

#include <spdlog/spdlog.h>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "report/result.hpp"
#include "strategy/analyzer.hpp"

// CSV: timestamp_ms,open,high,low,close[,volume] with an optional header row
static bool load_csv(const std::string& path, std::vector<core::PricePoint>& out) {
    std::ifstream f(path);
    if (!f.good()) return false;
    std::string line;
    while (std::getline(f, line)) {
        if (line.empty() || !(std::isdigit(static_cast<unsigned char>(line[0])) || line[0] == '-')) continue;
        std::stringstream ss(line);
        std::string x; core::PricePoint p{};
        if (!std::getline(ss,x,',')) continue; p.timestamp_ms = std::stoll(x);
        if (!std::getline(ss,x,',')) continue; p.open  = std::stod(x);
        if (!std::getline(ss,x,',')) continue; p.high  = std::stod(x);
        if (!std::getline(ss,x,',')) continue; p.low   = std::stod(x);
        if (!std::getline(ss,x,',')) continue; p.close = std::stod(x);
        if (std::getline(ss,x,',') && !x.empty()) p.volume = std::stod(x);
        out.push_back(p);
    }
    return !out.empty();
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Usage: chartpat_scan <csv_path> [config.json] [instrument_id]\n";
        return 1;
    }
    const std::string path = argv[1];
    const std::string id   = (argc >= 4 ? argv[3] : path);

    std::vector<core::PricePoint> rows;
    try {
        if (!load_csv(path, rows)) {
            spdlog::error("cannot load CSV: {}", path);
            return 2;
        }
    } catch (const std::exception& e) {
        spdlog::error("{}: malformed row: {}", path, e.what());
        return 2;
    }

    try {
        const core::AnalysisConfig cfg = (argc >= 3 ? core::load_config(argv[2]) : core::AnalysisConfig{});
        const auto result = strategy::analyze(id, core::Series(std::move(rows)), cfg);
        std::cout << report::to_json(result).dump(2) << "\n";
        spdlog::info("{}", result.summary);
        for (const auto& p : result.top_patterns) {
            const auto text = report::explain(p.pattern);
            if (!text.empty()) spdlog::info("{}: {}", p.pattern, text);
        }
    } catch (const core::ConfigError& e) {
        spdlog::error("config: {}", e.what());
        return 3;
    } catch (const core::InvalidSeries& e) {
        spdlog::error("series: {}", e.what());
        return 4;
    }
    return 0;
}
