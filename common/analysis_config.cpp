#include "common/analysis_config.hpp"

#include <cmath>

#include "common/price_converter.hpp"

namespace impactflow {

bool AnalysisConfig::validate(std::string& error) const {
    if (grid_step_us <= 0) {
        error = "grid step must be positive";
        return false;
    }
    if (horizons_us.empty()) {
        error = "at least one horizon is required";
        return false;
    }
    for (int64_t h : horizons_us) {
        if (h <= 0) {
            error = "horizons must be positive";
            return false;
        }
        if (h % grid_step_us != 0) {
            error = "horizon " + std::to_string(h) + "us is not a multiple of the grid step "
                    + std::to_string(grid_step_us) + "us";
            return false;
        }
    }
    if (!(low_fidelity_threshold >= 0.0 && low_fidelity_threshold <= 1.0)) {
        error = "low-fidelity threshold must lie in [0, 1]";
        return false;
    }
    if (min_pca_observations < 2) {
        error = "PCA needs at least 2 observations";
        return false;
    }
    if (!(rank_tolerance > 0.0) || !std::isfinite(rank_tolerance)) {
        error = "rank tolerance must be a positive finite number";
        return false;
    }
    if (!PriceConverter::valid_scale(price_scale)) {
        error = "price scale must be a positive finite number";
        return false;
    }
    if (window_start_us && window_end_us && *window_end_us < *window_start_us) {
        error = "analysis window ends before it starts";
        return false;
    }
    return true;
}

} // namespace impactflow
