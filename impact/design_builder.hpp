#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/records.hpp"

namespace impactflow {

/// Aligns composite OFI across symbols against one target's forward returns.
///
/// Composite OFI stamped at g covers the bin (g - step, g]. A return over
/// [t, t+h] is paired with OFI summed over the same window, i.e. the bins at
/// t+step .. t+h (contemporaneous), or over the window that ends at t, the bins
/// at t-h+step .. t (lagged). A row is kept only when the target return and
/// every bin of every symbol's composite exist. Nothing is imputed.
class CrossImpactDesignBuilder {
public:
    /// Series that did not fit (status != OK) are left out of the universe.
    CrossImpactDesignBuilder(const std::vector<CompositeOFISeries>& composites, int64_t step_us);

    DesignMatrix build(const PriceChangeSeries& target_returns, ImpactMode mode) const;

    /// Symbols with a usable composite, sorted.
    const std::vector<std::string>& universe() const { return symbols_; }

    bool contains(const std::string& symbol) const { return index_.count(symbol) > 0; }

private:
    using ScoreIndex = std::unordered_map<int64_t, double>;

    /// Sum of the scores at first_us, first_us + step, .., last_us; false if any is missing.
    bool window_sum(const ScoreIndex& scores, int64_t first_us, int64_t last_us, double& sum) const;

    int64_t step_us_;
    std::vector<std::string> symbols_;
    std::unordered_map<std::string, ScoreIndex> index_;
};

} // namespace impactflow
