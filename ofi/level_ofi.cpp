#include "ofi/level_ofi.hpp"

#include <algorithm>

#include "common/log.hpp"

namespace impactflow {

FilteredSnapshots filter_snapshots(const std::string& symbol,
                                   const std::vector<BookSnapshot>& snapshots) {
    FilteredSnapshots out;
    out.symbol = symbol;
    out.accepted.reserve(snapshots.size());
    auto& diag = out.diagnostics;
    diag.snapshots_in = snapshots.size();

    bool have_last = false;
    int64_t last_ts = 0;

    for (const auto& snap : snapshots) {
        if (snap.symbol != symbol) {
            diag.rejected_symbol_mismatch++;
            continue;
        }
        if (have_last && snap.timestamp_us <= last_ts) {
            diag.rejected_non_monotonic++;
            continue;
        }
        if (!snap.ladders_ordered()) {
            diag.rejected_invalid_book++;
            continue;
        }
        if (snap.bid_depth() < kMaxLevels || snap.ask_depth() < kMaxLevels)
            diag.short_book_snapshots++;

        last_ts = snap.timestamp_us;
        have_last = true;
        out.accepted.push_back(snap);
    }
    diag.snapshots_used = out.accepted.size();

    if (diag.short_book_snapshots > 0) {
        log_info("LevelOFI", "%s: %zu snapshot(s) with %s, missing levels read as size 0",
                 symbol.c_str(), diag.short_book_snapshots,
                 data_issue_to_string(DataIssue::MISSING_LEVEL_DATA));
    }
    if (diag.rejected_non_monotonic > 0) {
        log_warn("LevelOFI", "%s: rejected %zu snapshot(s) with %s",
                 symbol.c_str(), diag.rejected_non_monotonic,
                 data_issue_to_string(DataIssue::NON_MONOTONIC_TIMESTAMP));
    }
    if (diag.rejected_invalid_book > 0) {
        log_warn("LevelOFI", "%s: rejected %zu snapshot(s) with %s",
                 symbol.c_str(), diag.rejected_invalid_book,
                 data_issue_to_string(DataIssue::INVALID_BOOK));
    }
    if (diag.rejected_symbol_mismatch > 0) {
        log_warn("LevelOFI", "%s: rejected %zu snapshot(s) with %s",
                 symbol.c_str(), diag.rejected_symbol_mismatch,
                 data_issue_to_string(DataIssue::SYMBOL_MISMATCH));
    }
    return out;
}

double LevelOFICalculator::bid_contribution(const BookLevel& prev, const BookLevel& cur) const {
    const int cmp = converter_.compare(cur.price, prev.price);
    if (cmp > 0) return cur.size;
    if (cmp == 0) return cur.size - prev.size;
    return -prev.size;
}

double LevelOFICalculator::ask_contribution(const BookLevel& prev, const BookLevel& cur) const {
    const int cmp = converter_.compare(cur.price, prev.price);
    if (cmp < 0) return cur.size;
    if (cmp == 0) return cur.size - prev.size;
    return -prev.size;
}

LevelVector LevelOFICalculator::compute(const BookSnapshot& prev, const BookSnapshot& cur) const {
    LevelVector ofi{};

    for (size_t n = 0; n < kMaxLevels; ++n) {
        double bid = 0.0;
        const bool prev_bid = n < prev.bid_depth();
        const bool cur_bid = n < cur.bid_depth();
        if (prev_bid || cur_bid) {
            const BookLevel p = prev_bid ? prev.bids[n] : BookLevel{cur.bids[n].price, 0.0};
            const BookLevel c = cur_bid ? cur.bids[n] : BookLevel{prev.bids[n].price, 0.0};
            bid = bid_contribution(p, c);
        }

        double ask = 0.0;
        const bool prev_ask = n < prev.ask_depth();
        const bool cur_ask = n < cur.ask_depth();
        if (prev_ask || cur_ask) {
            const BookLevel p = prev_ask ? prev.asks[n] : BookLevel{cur.asks[n].price, 0.0};
            const BookLevel c = cur_ask ? cur.asks[n] : BookLevel{prev.asks[n].price, 0.0};
            ask = ask_contribution(p, c);
        }

        ofi[n] = bid - ask;
    }
    return ofi;
}

LevelOFISeries LevelOFICalculator::compute_series(const FilteredSnapshots& filtered) const {
    LevelOFISeries series;
    series.symbol = filtered.symbol;
    series.diagnostics = filtered.diagnostics;

    const auto& snaps = filtered.accepted;
    if (snaps.size() < 2) return series;

    series.records.reserve(snaps.size() - 1);
    for (size_t i = 1; i < snaps.size(); ++i) {
        const auto& prev = snaps[i - 1];
        const auto& cur = snaps[i];
        const size_t depth = std::min({prev.bid_depth(), prev.ask_depth(),
                                       cur.bid_depth(), cur.ask_depth()});
        series.records.push_back({
            filtered.symbol,
            cur.timestamp_us,
            compute(prev, cur),
            static_cast<uint8_t>(depth)
        });
    }
    return series;
}

LevelOFISeries aggregate_to_grid(const LevelOFISeries& series, const TimeGrid& grid) {
    LevelOFISeries out;
    out.symbol = series.symbol;
    out.diagnostics = series.diagnostics;
    if (grid.empty() || series.records.empty()) return out;

    const int64_t lower_bound_us = grid.origin_us - grid.step_us;

    // Bin index for every record inside the grid span.
    size_t first_bin = grid.count;
    size_t last_bin = 0;
    std::vector<LevelVector> sums(grid.count, LevelVector{});
    std::vector<uint8_t> depth(grid.count, static_cast<uint8_t>(kMaxLevels));

    for (const auto& rec : series.records) {
        if (rec.timestamp_us <= lower_bound_us) continue;
        const size_t bin = grid.ceil_index(rec.timestamp_us);
        if (bin >= grid.count) continue;
        for (size_t n = 0; n < kMaxLevels; ++n) sums[bin][n] += rec.ofi[n];
        depth[bin] = std::min(depth[bin], rec.levels_reported);
        first_bin = std::min(first_bin, bin);
        last_bin = std::max(last_bin, bin);
    }
    if (first_bin == grid.count) return out;

    out.records.reserve(last_bin - first_bin + 1);
    for (size_t b = first_bin; b <= last_bin; ++b) {
        out.records.push_back({series.symbol, grid.point(b), sums[b], depth[b]});
    }
    return out;
}

} // namespace impactflow
