#include "returns/price_change.hpp"

#include <cmath>

#include "common/log.hpp"

namespace impactflow {

std::vector<std::optional<double>> PriceChangeComputer::sample_mid(
    const std::vector<BookSnapshot>& snapshots,
    const TimeGrid& grid) const
{
    std::vector<std::optional<double>> mids(grid.count);
    if (grid.empty()) return mids;

    std::optional<double> last_mid;
    size_t cursor = 0;
    for (size_t i = 0; i < grid.count; ++i) {
        const int64_t g = grid.point(i);
        while (cursor < snapshots.size() && snapshots[cursor].timestamp_us <= g) {
            const auto& snap = snapshots[cursor];
            if (snap.has_top()) last_mid = snap.mid_price();
            ++cursor;
        }
        mids[i] = last_mid;
    }
    return mids;
}

PriceChangeSeries PriceChangeComputer::from_samples(
    const std::string& symbol,
    const std::vector<std::optional<double>>& mids,
    const TimeGrid& grid,
    int64_t horizon_us) const
{
    PriceChangeSeries series;
    series.symbol = symbol;
    series.horizon_us = horizon_us;
    series.convention = convention_;

    if (grid.empty()) return series;
    if (horizon_us <= 0 || horizon_us % grid.step_us != 0) {
        log_error("PriceChange", "%s: horizon %lldus does not fit grid step %lldus",
                  symbol.c_str(), static_cast<long long>(horizon_us),
                  static_cast<long long>(grid.step_us));
        return series;
    }

    const size_t steps = static_cast<size_t>(horizon_us / grid.step_us);
    if (steps >= grid.count) return series;

    size_t skipped_non_positive = 0;
    series.records.reserve(grid.count - steps);
    for (size_t i = 0; i + steps < grid.count; ++i) {
        const auto& start = mids[i];
        const auto& end = mids[i + steps];
        if (!start || !end) continue;

        double value = 0.0;
        if (convention_ == ReturnConvention::LOG_RETURN) {
            if (*start <= 0.0 || *end <= 0.0) {
                skipped_non_positive++;
                continue;
            }
            value = std::log(*end) - std::log(*start);
        } else {
            value = *end - *start;
        }
        series.records.push_back({symbol, grid.point(i), horizon_us, value});
    }

    if (skipped_non_positive > 0) {
        log_warn("PriceChange", "%s: skipped %zu grid point(s) with a non-positive mid",
                 symbol.c_str(), skipped_non_positive);
    }
    return series;
}

PriceChangeSeries PriceChangeComputer::compute(const std::string& symbol,
                                               const std::vector<BookSnapshot>& snapshots,
                                               const TimeGrid& grid,
                                               int64_t horizon_us) const {
    return from_samples(symbol, sample_mid(snapshots, grid), grid, horizon_us);
}

std::vector<PriceChangeSeries> PriceChangeComputer::compute_all(
    const std::string& symbol,
    const std::vector<BookSnapshot>& snapshots,
    const TimeGrid& grid,
    const std::vector<int64_t>& horizons_us) const
{
    const auto mids = sample_mid(snapshots, grid);
    std::vector<PriceChangeSeries> out;
    out.reserve(horizons_us.size());
    for (int64_t h : horizons_us) {
        out.push_back(from_samples(symbol, mids, grid, h));
    }
    return out;
}

} // namespace impactflow
