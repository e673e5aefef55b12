#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/records.hpp"

namespace impactflow {

/// Target x source coefficient grid for one (horizon, mode): row i holds target
/// i's regression, column j the coefficient on symbol j's OFI, the diagonal the
/// self term. Failed units leave a NaN row and an empty R².
struct CrossImpactMatrix {
    int64_t horizon_us = 0;
    ImpactMode mode = ImpactMode::CONTEMPORANEOUS;
    std::vector<std::string> symbols;
    std::vector<std::vector<double>> coefficients;
    std::vector<std::optional<double>> r_squared;

    size_t size() const { return symbols.size(); }
};

CrossImpactMatrix build_impact_matrix(const std::vector<RegressionResult>& results,
                                      const std::vector<std::string>& symbols,
                                      int64_t horizon_us,
                                      ImpactMode mode);

} // namespace impactflow
