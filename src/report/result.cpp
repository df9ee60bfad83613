#include "report/result.hpp"
#include "core/errors.hpp"
#include <fmt/format.h>

using json = nlohmann::json;

namespace report {

static core::Signal read_signal(const json& j){
    auto s = core::signal_from_string(j.get<std::string>());
    if (!s) throw core::ResultFormatError(fmt::format("unknown signal '{}'", j.get<std::string>()));
    return *s;
}

static core::Category read_category(const std::string& name){
    auto c = core::category_from_string(name);
    if (!c) throw core::ResultFormatError(fmt::format("unknown category '{}'", name));
    return *c;
}

bool operator==(const AnalysisResult& a, const AnalysisResult& b){
    return a.instrument_id == b.instrument_id && a.overall_signal == b.overall_signal
        && a.overall_confidence == b.overall_confidence
        && a.patterns_detected == b.patterns_detected
        && a.top_patterns == b.top_patterns && a.category_summary == b.category_summary
        && a.summary == b.summary && a.skipped == b.skipped;
}

AnalysisResult make_result(const std::string& instrument_id, std::size_t patterns_detected,
                           const strategy::Aggregate& agg, std::vector<std::string> skipped){
    AnalysisResult r;
    r.instrument_id      = instrument_id;
    r.overall_signal     = agg.signal;
    r.overall_confidence = agg.confidence;
    r.patterns_detected  = patterns_detected;
    r.top_patterns       = agg.ranked;
    r.category_summary   = agg.categories;
    r.skipped            = std::move(skipped);
    r.summary            = summarize(r);
    return r;
}

json to_json(const core::PatternInstance& p){
    json levels = json::object();
    for (const auto& [k, v] : p.key_levels) levels[k] = v;
    return {
        {"pattern", p.pattern},
        {"category", core::to_string(p.category)},
        {"confidence", p.confidence},
        {"signal", core::to_string(p.signal)},
        {"description", p.description},
        {"key_levels", levels},
        {"span", {p.span.first, p.span.last}},
    };
}

json to_json(const AnalysisResult& r){
    json top = json::array();
    for (const auto& p : r.top_patterns) top.push_back(to_json(p));
    json cats = json::object();
    for (const auto& [c, s] : r.category_summary)
        cats[core::to_string(c)] = {{"count", s.count}, {"dominant_signal", core::to_string(s.dominant_signal)}};
    return {
        {"instrument_id", r.instrument_id},
        {"overall_signal", core::to_string(r.overall_signal)},
        {"overall_confidence", r.overall_confidence},
        {"patterns_detected", r.patterns_detected},
        {"top_patterns", top},
        {"category_summary", cats},
        {"summary", r.summary},
        {"skipped", r.skipped},
    };
}

core::PatternInstance instance_from_json(const json& j){
    try {
        core::PatternInstance p;
        p.pattern     = j.at("pattern").get<std::string>();
        p.category    = read_category(j.at("category").get<std::string>());
        p.confidence  = j.at("confidence").get<double>();
        p.signal      = read_signal(j.at("signal"));
        p.description = j.at("description").get<std::string>();
        for (const auto& [k, v] : j.at("key_levels").items()) p.key_levels[k] = v.get<double>();
        const auto& span = j.at("span");
        if (!span.is_array() || span.size() != 2) throw core::ResultFormatError("'span' must be [first, last]");
        p.span = {span[0].get<std::size_t>(), span[1].get<std::size_t>()};
        return p;
    } catch (const json::exception& e) {
        throw core::ResultFormatError(fmt::format("pattern instance: {}", e.what()));
    }
}

AnalysisResult from_json(const json& j){
    try {
        AnalysisResult r;
        r.instrument_id      = j.at("instrument_id").get<std::string>();
        r.overall_signal     = read_signal(j.at("overall_signal"));
        r.overall_confidence = j.at("overall_confidence").get<double>();
        r.patterns_detected  = j.at("patterns_detected").get<std::size_t>();
        for (const auto& p : j.at("top_patterns")) r.top_patterns.push_back(instance_from_json(p));
        for (const auto& [name, s] : j.at("category_summary").items())
            r.category_summary[read_category(name)] = {s.at("count").get<std::size_t>(),
                                                       read_signal(s.at("dominant_signal"))};
        r.summary = j.value("summary", std::string{});
        if (j.contains("skipped")) r.skipped = j.at("skipped").get<std::vector<std::string>>();
        return r;
    } catch (const json::exception& e) {
        throw core::ResultFormatError(fmt::format("analysis result: {}", e.what()));
    }
}

std::string summarize(const AnalysisResult& r){
    std::string out = fmt::format("{}: {} {:.0f}%", r.instrument_id, core::to_string(r.overall_signal),
                                  r.overall_confidence);
    if (r.top_patterns.empty()) return out + " | No significant patterns detected";

    const auto& top = r.top_patterns.front();
    out += fmt::format(" | Primary: {} ({:.0f}%)", top.pattern, top.confidence);
    switch (r.overall_signal) {
        case core::Signal::Buy:  out += " | Bullish signals dominate"; break;
        case core::Signal::Sell: out += " | Bearish signals dominate"; break;
        default:                 out += " | Mixed or neutral signals"; break;
    }
    if (r.top_patterns.size() > 1)
        out += fmt::format(" | Additional patterns: {}", r.top_patterns.size() - 1);
    return out;
}

std::string explain(const std::string& pattern){
    static const std::map<std::string, std::string> catalogue{
        {"Head and Shoulders", "Bearish reversal: a higher middle peak between two similar shoulders; a close below the neckline completes it."},
        {"Inverse Head and Shoulders", "Bullish reversal: a lower middle valley between two similar shoulders; a close above the neckline completes it."},
        {"Double Top", "Bearish reversal: two peaks at about the same price mark exhausted buying."},
        {"Double Bottom", "Bullish reversal: two valleys at about the same price mark exhausted selling."},
        {"Ascending Triangle", "Bullish continuation: flat resistance over rising support, usually resolved upwards."},
        {"Descending Triangle", "Bearish continuation: falling resistance over flat support, usually resolved downwards."},
        {"Symmetrical Triangle", "Neutral: converging trendlines; direction follows the breakout."},
        {"Bull Flag", "Bullish continuation: a tight, parallel pause after a sharp rise."},
        {"Bear Flag", "Bearish continuation: a tight, parallel pause after a sharp fall."},
        {"Bull Pennant", "Bullish continuation: a small converging pause after a sharp rise."},
        {"Bear Pennant", "Bearish continuation: a small converging pause after a sharp fall."},
        {"Resistance Breakout", "Bullish: the close cleared a repeatedly tested resistance level."},
        {"Support Breakdown", "Bearish: the close fell through a repeatedly tested support level."},
        {"Approaching Resistance", "Decision point: price is close to a tested resistance level."},
        {"Approaching Support", "Decision point: price is close to a tested support level."},
        {"Doji", "Indecision: open and close almost equal."},
        {"Hammer", "Bullish reversal candle: small body with a long lower wick after a decline."},
        {"Hanging Man", "Bearish warning candle: small body with a long lower wick after a rise."},
        {"Bullish Engulfing", "Bullish reversal: a rising body swallows the prior falling body."},
        {"Bearish Engulfing", "Bearish reversal: a falling body swallows the prior rising body."},
        {"Piercing Line", "Bullish reversal: a gap down that closes above the prior body's midpoint."},
        {"Dark Cloud Cover", "Bearish reversal: a gap up that closes below the prior body's midpoint."},
        {"Morning Star", "Bullish reversal: long falling candle, small star, then a strong rising candle."},
        {"Evening Star", "Bearish reversal: long rising candle, small star, then a strong falling candle."},
    };
    auto it = catalogue.find(pattern);
    return it == catalogue.end() ? std::string{} : it->second;
}

} // namespace report
