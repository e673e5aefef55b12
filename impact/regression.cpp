#include "impact/regression.hpp"

#include <cmath>
#include <limits>

#include <Eigen/Dense>

#include "common/log.hpp"
#include "common/time_grid.hpp"

namespace impactflow {

std::optional<double> dominance_ratio(double self_coefficient,
                                      const std::map<std::string, double>& cross_coefficients) {
    if (cross_coefficients.empty()) return std::nullopt;
    const double self_abs = std::abs(self_coefficient);
    if (!(self_abs > 0.0) || !std::isfinite(self_abs)) return std::nullopt;

    double sum = 0.0;
    for (const auto& [sym, coef] : cross_coefficients) {
        (void)sym;
        sum += std::abs(coef);
    }
    const double mean_cross = sum / static_cast<double>(cross_coefficients.size());
    return mean_cross / self_abs;
}

RegressionResult RegressionEngine::fit(const DesignMatrix& design) const {
    RegressionResult result;
    result.target_symbol = design.target_symbol;
    result.horizon_us = design.horizon_us;
    result.mode = design.mode;

    const size_t n = design.rows.size();
    const size_t p = 2 + design.cross_symbols.size();
    result.observations = n;
    result.regressors = p;

    if (n <= p) {
        result.status = UnitStatus::INSUFFICIENT_HISTORY;
        log_warn("Regression", "%s h=%llds %s: %s (%zu rows for %zu regressors)",
                 design.target_symbol.c_str(),
                 static_cast<long long>(design.horizon_us / kMicrosPerSecond),
                 mode_to_string(design.mode),
                 data_issue_to_string(DataIssue::INSUFFICIENT_HISTORY), n, p);
        return result;
    }

    const auto rows = static_cast<Eigen::Index>(n);
    const auto cols = static_cast<Eigen::Index>(p);
    Eigen::MatrixXd x(rows, cols);
    Eigen::VectorXd y(rows);
    for (Eigen::Index r = 0; r < rows; ++r) {
        const auto& row = design.rows[static_cast<size_t>(r)];
        y(r) = row.target_return;
        x(r, 0) = 1.0;
        x(r, 1) = row.self_ofi;
        for (size_t j = 0; j < design.cross_symbols.size(); ++j) {
            x(r, static_cast<Eigen::Index>(2 + j)) = row.cross_ofi.at(design.cross_symbols[j]);
        }
    }

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(rows, cols);
    qr.setThreshold(rank_tolerance_);
    qr.compute(x);
    if (qr.rank() < cols) {
        result.status = UnitStatus::SINGULAR_DESIGN;
        log_warn("Regression", "%s h=%llds %s: %s (rank %lld of %zu)",
                 design.target_symbol.c_str(),
                 static_cast<long long>(design.horizon_us / kMicrosPerSecond),
                 mode_to_string(design.mode),
                 data_issue_to_string(DataIssue::SINGULAR_DESIGN_MATRIX),
                 static_cast<long long>(qr.rank()), p);
        return result;
    }

    const Eigen::VectorXd beta = qr.solve(y);
    const Eigen::VectorXd residuals = y - x * beta;
    const double sse = residuals.squaredNorm();
    const double sst = (y.array() - y.mean()).matrix().squaredNorm();
    const double dof = static_cast<double>(n - p);

    result.intercept = beta(0);
    result.self_coefficient = beta(1);
    for (size_t j = 0; j < design.cross_symbols.size(); ++j) {
        result.cross_coefficients.emplace(design.cross_symbols[j],
                                          beta(static_cast<Eigen::Index>(2 + j)));
    }
    result.residual_std = std::sqrt(sse / dof);

    // Constant response: the fit is fine but there is no variance to explain.
    if (sst > std::numeric_limits<double>::epsilon() * y.squaredNorm() && sst > 0.0) {
        const double r2 = 1.0 - sse / sst;
        result.r_squared = r2;
        result.adjusted_r_squared = 1.0 - (1.0 - r2) * static_cast<double>(n - 1) / dof;
    }

    result.dominance_ratio = dominance_ratio(result.self_coefficient, result.cross_coefficients);
    result.status = UnitStatus::OK;
    return result;
}

} // namespace impactflow
