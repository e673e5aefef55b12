#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/book_snapshot.hpp"
#include "common/records.hpp"
#include "common/time_grid.hpp"

namespace impactflow {

/// Forward mid-price returns sampled on a calendar grid.
///
/// The grid value at g is the last mid observed at or before g (forward fill, no
/// look-ahead). The return for horizon h at g compares the grid values at g and
/// g + h under one convention for the whole run.
class PriceChangeComputer {
public:
    explicit PriceChangeComputer(ReturnConvention convention = ReturnConvention::LOG_RETURN)
        : convention_(convention) {}

    /// Forward-filled mid per grid point; empty before the first observation.
    /// Snapshots must be in increasing time order; a one-sided book has no mid.
    std::vector<std::optional<double>> sample_mid(const std::vector<BookSnapshot>& snapshots,
                                                  const TimeGrid& grid) const;

    /// horizon_us must be a positive multiple of grid.step_us.
    PriceChangeSeries compute(const std::string& symbol,
                              const std::vector<BookSnapshot>& snapshots,
                              const TimeGrid& grid,
                              int64_t horizon_us) const;

    /// Returns for several horizons from one grid sampling.
    std::vector<PriceChangeSeries> compute_all(const std::string& symbol,
                                               const std::vector<BookSnapshot>& snapshots,
                                               const TimeGrid& grid,
                                               const std::vector<int64_t>& horizons_us) const;

    ReturnConvention convention() const { return convention_; }

private:
    PriceChangeSeries from_samples(const std::string& symbol,
                                   const std::vector<std::optional<double>>& mids,
                                   const TimeGrid& grid,
                                   int64_t horizon_us) const;

    ReturnConvention convention_;
};

} // namespace impactflow
