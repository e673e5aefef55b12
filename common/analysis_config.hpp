#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/records.hpp"
#include "common/time_grid.hpp"

namespace impactflow {

/// Parameters for one batch run. Defaults reproduce the one-minute study setup.
struct AnalysisConfig {
    int64_t grid_step_us = 60 * kMicrosPerSecond;
    std::vector<int64_t> horizons_us = {60 * kMicrosPerSecond, 300 * kMicrosPerSecond};
    ReturnConvention return_convention = ReturnConvention::LOG_RETURN;

    /// Sum event-time OFI into grid bins before the PCA fit.
    bool aggregate_ofi_to_grid = true;

    size_t min_pca_observations = 3;
    double low_fidelity_threshold = 0.5;
    double rank_tolerance = 1e-10;
    double price_scale = 10000.0;

    /// Worker count for per-symbol and per-unit tasks; 0 = hardware concurrency.
    unsigned threads = 0;

    std::optional<int64_t> window_start_us;
    std::optional<int64_t> window_end_us;

    bool validate(std::string& error) const;
};

} // namespace impactflow
