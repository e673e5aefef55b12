#include "impact/impact_matrix.hpp"

#include <limits>
#include <unordered_map>

namespace impactflow {

CrossImpactMatrix build_impact_matrix(const std::vector<RegressionResult>& results,
                                      const std::vector<std::string>& symbols,
                                      int64_t horizon_us,
                                      ImpactMode mode) {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    CrossImpactMatrix m;
    m.horizon_us = horizon_us;
    m.mode = mode;
    m.symbols = symbols;
    m.coefficients.assign(symbols.size(), std::vector<double>(symbols.size(), nan));
    m.r_squared.assign(symbols.size(), std::nullopt);

    std::unordered_map<std::string, size_t> column;
    for (size_t j = 0; j < symbols.size(); ++j) column.emplace(symbols[j], j);

    for (const auto& res : results) {
        if (res.horizon_us != horizon_us || res.mode != mode || !res.ok()) continue;
        auto row_it = column.find(res.target_symbol);
        if (row_it == column.end()) continue;

        const size_t i = row_it->second;
        auto& row = m.coefficients[i];
        row[i] = res.self_coefficient;
        for (const auto& [source, coef] : res.cross_coefficients) {
            auto col_it = column.find(source);
            if (col_it != column.end()) row[col_it->second] = coef;
        }
        m.r_squared[i] = res.r_squared;
    }
    return m;
}

} // namespace impactflow
