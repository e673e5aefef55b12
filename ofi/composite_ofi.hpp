#pragma once

#include <cstddef>

#include "common/records.hpp"

namespace impactflow {

/// Projects a symbol's 5-level OFI history onto its first principal component.
///
/// Each level is standardised on its own (zero-variance levels become all-zero),
/// the loading vector is the top eigenvector of the standardised covariance, and
/// its sign is fixed so the score co-moves with level-1 OFI. Fits are per symbol.
class CompositeOFIReducer {
public:
    explicit CompositeOFIReducer(size_t min_observations = 3,
                                 double low_fidelity_threshold = 0.5)
        : min_observations_(min_observations),
          low_fidelity_threshold_(low_fidelity_threshold) {}

    CompositeOFISeries fit_transform(const LevelOFISeries& series) const;

    size_t min_observations() const { return min_observations_; }
    double low_fidelity_threshold() const { return low_fidelity_threshold_; }

private:
    size_t min_observations_;
    double low_fidelity_threshold_;
};

} // namespace impactflow
