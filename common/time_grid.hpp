#pragma once

#include <cstddef>
#include <cstdint>

namespace impactflow {

constexpr int64_t kMicrosPerSecond = 1'000'000;

/// Fixed calendar grid: origin_us, origin_us + step_us, ... (count points).
/// Shared by every symbol so per-symbol series align on identical keys.
struct TimeGrid {
    int64_t origin_us = 0;
    int64_t step_us = 0;
    size_t count = 0;

    bool empty() const { return count == 0 || step_us <= 0; }

    int64_t point(size_t i) const {
        return origin_us + static_cast<int64_t>(i) * step_us;
    }

    int64_t last_point() const { return empty() ? origin_us : point(count - 1); }

    /// Index of the first grid point >= ts (count when past the end).
    size_t ceil_index(int64_t ts_us) const {
        if (empty() || ts_us <= origin_us) return 0;
        const int64_t offset = ts_us - origin_us;
        const size_t idx = static_cast<size_t>((offset + step_us - 1) / step_us);
        return idx < count ? idx : count;
    }

    /// Smallest grid on step multiples whose points span [start_us, end_us].
    static TimeGrid covering(int64_t start_us, int64_t end_us, int64_t step_us) {
        TimeGrid g;
        if (step_us <= 0 || end_us < start_us) return g;
        g.step_us = step_us;
        int64_t origin = (start_us / step_us) * step_us;
        if (origin > start_us) origin -= step_us;   // negative timestamps
        g.origin_us = origin;
        g.count = static_cast<size_t>((end_us - origin + step_us - 1) / step_us) + 1;
        return g;
    }
};

} // namespace impactflow
