#pragma once

#include <string>
#include <vector>

#include "common/book_snapshot.hpp"
#include "common/price_converter.hpp"
#include "common/records.hpp"
#include "common/time_grid.hpp"

namespace impactflow {

/// Snapshots that survived input checks, in their original order.
struct FilteredSnapshots {
    std::string symbol;
    std::vector<BookSnapshot> accepted;
    SeriesDiagnostics diagnostics;
};

/// Drops snapshots for another symbol, with a timestamp not strictly after the
/// last accepted one, or with unordered ladders. Never reorders what it keeps.
FilteredSnapshots filter_snapshots(const std::string& symbol,
                                   const std::vector<BookSnapshot>& snapshots);

/// Multi-level order flow imbalance between consecutive book states.
///
/// Bid contribution at level n: size(t) on a price improvement, size(t) - size(t-1)
/// at an unchanged price, -size(t-1) when the price falls back. The ask side mirrors
/// it and OFI(n) = bid - ask. Prices are compared in ticks of the converter.
class LevelOFICalculator {
public:
    explicit LevelOFICalculator(PriceConverter converter = PriceConverter())
        : converter_(converter) {}

    /// A level missing on one snapshot is read as {other snapshot's price, 0};
    /// a level missing on both contributes 0.
    LevelVector compute(const BookSnapshot& prev, const BookSnapshot& cur) const;

    /// One record per accepted snapshot after the first.
    LevelOFISeries compute_series(const FilteredSnapshots& filtered) const;

    LevelOFISeries compute_series(const std::string& symbol,
                                  const std::vector<BookSnapshot>& snapshots) const {
        return compute_series(filter_snapshots(symbol, snapshots));
    }

    const PriceConverter& converter() const { return converter_; }

private:
    double bid_contribution(const BookLevel& prev, const BookLevel& cur) const;
    double ask_contribution(const BookLevel& prev, const BookLevel& cur) const;

    PriceConverter converter_;
};

/// Sums event OFI into grid bins (g - step, g]. Bins from the one holding the first
/// event through the one holding the last are emitted, empty bins as zero vectors.
LevelOFISeries aggregate_to_grid(const LevelOFISeries& series, const TimeGrid& grid);

} // namespace impactflow
