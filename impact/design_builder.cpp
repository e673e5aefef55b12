#include "impact/design_builder.hpp"

#include <algorithm>
#include <utility>

namespace impactflow {

CrossImpactDesignBuilder::CrossImpactDesignBuilder(const std::vector<CompositeOFISeries>& composites,
                                                   int64_t step_us)
    : step_us_(step_us) {
    for (const auto& series : composites) {
        if (!series.ok() || series.records.empty()) continue;
        auto& scores = index_[series.symbol];
        scores.reserve(series.records.size());
        for (const auto& rec : series.records) {
            scores.emplace(rec.timestamp_us, rec.score);
        }
        symbols_.push_back(series.symbol);
    }
    std::sort(symbols_.begin(), symbols_.end());
    symbols_.erase(std::unique(symbols_.begin(), symbols_.end()), symbols_.end());
}

DesignMatrix CrossImpactDesignBuilder::build(const PriceChangeSeries& target_returns,
                                             ImpactMode mode) const {
    DesignMatrix design;
    design.target_symbol = target_returns.symbol;
    design.horizon_us = target_returns.horizon_us;
    design.mode = mode;
    design.candidate_rows = target_returns.records.size();

    auto self_it = index_.find(target_returns.symbol);
    if (self_it == index_.end()) {
        design.dropped_rows = design.candidate_rows;
        return design;
    }

    std::vector<const ScoreIndex*> cross;
    for (const auto& sym : symbols_) {
        if (sym == target_returns.symbol) continue;
        design.cross_symbols.push_back(sym);
        cross.push_back(&index_.at(sym));
    }

    const int64_t h = target_returns.horizon_us;
    if (step_us_ <= 0 || h <= 0 || h % step_us_ != 0) {
        design.dropped_rows = design.candidate_rows;
        return design;
    }
    // Window of OFI bins, relative to the return's start t
    const int64_t first_off = (mode == ImpactMode::LAGGED) ? step_us_ - h : step_us_;
    const int64_t last_off = (mode == ImpactMode::LAGGED) ? 0 : h;

    design.rows.reserve(target_returns.records.size());
    for (const auto& ret : target_returns.records) {
        const int64_t first = ret.timestamp_us + first_off;
        const int64_t last = ret.timestamp_us + last_off;

        double self_sum = 0.0;
        if (!window_sum(self_it->second, first, last, self_sum)) {
            design.dropped_rows++;
            continue;
        }

        DesignRow row{ret.timestamp_us, target_returns.symbol, ret.value, self_sum, {}};
        bool complete = true;
        for (size_t j = 0; j < cross.size(); ++j) {
            double cross_sum = 0.0;
            if (!window_sum(*cross[j], first, last, cross_sum)) {
                complete = false;
                break;
            }
            row.cross_ofi.emplace(design.cross_symbols[j], cross_sum);
        }
        if (!complete) {
            design.dropped_rows++;
            continue;
        }
        design.rows.push_back(std::move(row));
    }
    return design;
}

bool CrossImpactDesignBuilder::window_sum(const ScoreIndex& scores, int64_t first_us,
                                          int64_t last_us, double& sum) const {
    sum = 0.0;
    for (int64_t t = first_us; t <= last_us; t += step_us_) {
        auto it = scores.find(t);
        if (it == scores.end()) return false;
        sum += it->second;
    }
    return true;
}

} // namespace impactflow
