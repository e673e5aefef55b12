#pragma once

#include <map>
#include <optional>
#include <string>

#include "common/records.hpp"

namespace impactflow {

/// Mean |cross coefficient| over |self coefficient|. Shared by the contemporaneous
/// and lagged fits so the two ratios are comparable. Empty without cross terms or
/// with a zero self coefficient.
std::optional<double> dominance_ratio(double self_coefficient,
                                      const std::map<std::string, double>& cross_coefficients);

/// Ordinary least squares of target return on {1, self OFI, cross OFIs}.
///
/// A design with no more rows than regressors reports INSUFFICIENT_HISTORY and a
/// rank-deficient one SINGULAR_DESIGN; both leave r_squared empty. Neither
/// condition throws, so a batch can carry on past a bad unit.
class RegressionEngine {
public:
    explicit RegressionEngine(double rank_tolerance = 1e-10)
        : rank_tolerance_(rank_tolerance) {}

    RegressionResult fit(const DesignMatrix& design) const;

    double rank_tolerance() const { return rank_tolerance_; }

private:
    double rank_tolerance_;
};

} // namespace impactflow
