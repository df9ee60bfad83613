#include "strategy/aggregator.hpp"
#include <algorithm>

namespace strategy {

namespace {

constexpr double kMaxHoldConfidence = 70.0;

int priority(core::Category c){
    int i = 0;
    for (auto k : core::kCategoryOrder) { if (k == c) return i; ++i; }
    return i;
}

} // namespace

bool operator==(const CategorySummary& a, const CategorySummary& b){
    return a.count == b.count && a.dominant_signal == b.dominant_signal;
}

double weighted_confidence(const core::PatternInstance& p, const core::AnalysisConfig& cfg){
    return p.confidence * cfg.weight(p.category);
}

Aggregate aggregate(const core::Instances& instances, const core::AnalysisConfig& cfg){
    Aggregate r;

    struct Scored { const core::PatternInstance* p; double w; std::size_t order; };
    std::vector<Scored> kept;
    for (std::size_t i = 0; i < instances.size(); ++i)
        if (instances[i].confidence > cfg.min_confidence)
            kept.push_back({&instances[i], weighted_confidence(instances[i], cfg), i});
    r.considered = kept.size();
    if (kept.empty()) return r;

    // per-category summary over the instances that passed the filter
    std::map<core::Category, std::pair<double, double>> sides;
    for (const auto& k : kept) {
        ++r.categories[k.p->category].count;
        auto& [buy, sell] = sides[k.p->category];
        if (k.p->signal == core::Signal::Buy)  buy  += k.w;
        if (k.p->signal == core::Signal::Sell) sell += k.w;
    }
    for (auto& [cat, sum] : r.categories) {
        const auto [buy, sell] = sides[cat];
        sum.dominant_signal = buy > sell ? core::Signal::Buy : sell > buy ? core::Signal::Sell : core::Signal::Hold;
    }

    double hold_score = 0.0;
    for (const auto& k : kept) {
        if (k.p->signal == core::Signal::Buy)       r.bullish_score += k.w;
        else if (k.p->signal == core::Signal::Sell) r.bearish_score += k.w;
        else                                        hold_score += k.w;
    }

    const double larger  = std::max(r.bullish_score, r.bearish_score);
    const double smaller = std::min(r.bullish_score, r.bearish_score);
    double win_score = std::max(hold_score, larger);
    if (larger > 0.0 && larger - smaller > cfg.decisiveness_threshold * larger) {
        r.signal  = r.bullish_score > r.bearish_score ? core::Signal::Buy : core::Signal::Sell;
        win_score = larger;
    }
    const auto agree = std::count_if(kept.begin(), kept.end(),
                                     [&](const Scored& k){ return k.p->signal == r.signal; });
    const double agreement = double(agree) / double(kept.size());
    r.confidence = core::clamp_confidence(0.6 * std::min(100.0, win_score) + 0.4 * 100.0 * agreement);
    if (r.signal == core::Signal::Hold) r.confidence = std::min(r.confidence, kMaxHoldConfidence);

    std::stable_sort(kept.begin(), kept.end(), [](const Scored& a, const Scored& b){
        if (a.w != b.w) return a.w > b.w;
        const int pa = priority(a.p->category), pb = priority(b.p->category);
        if (pa != pb) return pa < pb;
        return a.order < b.order;
    });
    const std::size_t n = std::min(cfg.top_n, kept.size());
    for (std::size_t i = 0; i < n; ++i) r.ranked.push_back(*kept[i].p);
    return r;
}

} // namespace strategy
