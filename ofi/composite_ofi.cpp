#include "ofi/composite_ofi.hpp"

#include <cmath>

#include <Eigen/Dense>

#include "common/log.hpp"

namespace impactflow {

namespace {

using LevelMatrix = Eigen::Matrix<double, Eigen::Dynamic, static_cast<int>(kMaxLevels)>;
using CovMatrix = Eigen::Matrix<double, static_cast<int>(kMaxLevels), static_cast<int>(kMaxLevels)>;
using Loading = Eigen::Matrix<double, static_cast<int>(kMaxLevels), 1>;

constexpr double kZeroStddev = 1e-12;

// Flip so cov(score, level 1) >= 0; when that is zero, make the dominant loading
// (lowest level on ties) positive.
void normalize_sign(Loading& w, const LevelMatrix& z, size_t n) {
    const Eigen::VectorXd scores = z * w;
    const double cov_l1 = scores.dot(z.col(0)) / static_cast<double>(n);
    const double tol = 1e-12;

    if (cov_l1 < -tol) {
        w = -w;
        return;
    }
    if (cov_l1 > tol) return;

    Eigen::Index dominant = 0;
    for (Eigen::Index i = 1; i < w.size(); ++i) {
        if (std::abs(w(i)) > std::abs(w(dominant)) + tol) dominant = i;
    }
    if (w(dominant) < 0.0) w = -w;
}

} // namespace

CompositeOFISeries CompositeOFIReducer::fit_transform(const LevelOFISeries& series) const {
    CompositeOFISeries out;
    out.symbol = series.symbol;
    const size_t n = series.records.size();
    out.observations = n;

    if (n < min_observations_ || n < 2) {
        out.status = UnitStatus::INSUFFICIENT_HISTORY;
        log_warn("CompositeOFI", "%s: %s (%zu OFI observations, need %zu)",
                 series.symbol.c_str(),
                 data_issue_to_string(DataIssue::INSUFFICIENT_HISTORY),
                 n, min_observations_);
        return out;
    }

    LevelMatrix x(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(kMaxLevels));
    for (size_t r = 0; r < n; ++r) {
        for (size_t c = 0; c < kMaxLevels; ++c) {
            x(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = series.records[r].ofi[c];
        }
    }

    // Standardise each level independently (population moments).
    LevelMatrix z(x.rows(), x.cols());
    for (Eigen::Index c = 0; c < x.cols(); ++c) {
        const double mean = x.col(c).mean();
        const Eigen::VectorXd centered = x.col(c).array() - mean;
        const double stddev = std::sqrt(centered.squaredNorm() / static_cast<double>(n));
        out.level_mean[static_cast<size_t>(c)] = mean;
        out.level_stddev[static_cast<size_t>(c)] = stddev;
        if (stddev < kZeroStddev) {
            z.col(c).setZero();
        } else {
            z.col(c) = centered / stddev;
        }
    }

    const CovMatrix cov = (z.transpose() * z) / static_cast<double>(n);
    const double trace = cov.trace();
    if (trace <= kZeroStddev) {
        out.status = UnitStatus::ZERO_VARIANCE;
        log_warn("CompositeOFI", "%s: every OFI level is constant over %zu observations",
                 series.symbol.c_str(), n);
        return out;
    }

    Eigen::SelfAdjointEigenSolver<CovMatrix> solver(cov);
    if (solver.info() != Eigen::Success) {
        out.status = UnitStatus::SINGULAR_DESIGN;
        log_error("CompositeOFI", "%s: eigen-decomposition of the level covariance failed",
                  series.symbol.c_str());
        return out;
    }

    // Eigenvalues come back ascending.
    const Eigen::Index top = static_cast<Eigen::Index>(kMaxLevels) - 1;
    Loading w = solver.eigenvectors().col(top);
    normalize_sign(w, z, n);

    out.eigenvalue = solver.eigenvalues()(top);
    out.explained_variance = out.eigenvalue / trace;
    out.low_fidelity = out.explained_variance < low_fidelity_threshold_;
    for (size_t c = 0; c < kMaxLevels; ++c) out.loadings[c] = w(static_cast<Eigen::Index>(c));

    if (out.low_fidelity) {
        log_warn("CompositeOFI", "%s: first component explains %.3f of variance (threshold %.3f), "
                 "composite flagged low-fidelity",
                 series.symbol.c_str(), out.explained_variance, low_fidelity_threshold_);
    }

    const Eigen::VectorXd scores = z * w;
    out.records.reserve(n);
    for (size_t r = 0; r < n; ++r) {
        out.records.push_back({
            series.symbol,
            series.records[r].timestamp_us,
            scores(static_cast<Eigen::Index>(r)),
            out.loadings,
            out.explained_variance,
            out.low_fidelity
        });
    }
    out.status = UnitStatus::OK;
    return out;
}

} // namespace impactflow
