#pragma once

#include <cstdint>
#include <cmath>
#include <string>
#include <unordered_map>

namespace impactflow {

using PriceTicks = int64_t;

/// Converts vendor double prices to integer ticks so level comparisons are exact.
/// Scale factor determines precision: e.g., 100 means 2 decimal places (cents).
class PriceConverter {
public:
    explicit PriceConverter(double scale_factor = 10000.0)
        : scale_factor_(scale_factor)
        , inv_scale_(1.0 / scale_factor)
    {}

    PriceTicks to_ticks(double external_price) const {
        return static_cast<PriceTicks>(std::llround(external_price * scale_factor_));
    }

    double to_price(PriceTicks ticks) const {
        return static_cast<double>(ticks) * inv_scale_;
    }

    /// -1, 0 or +1 as a is below, equal to or above b after tick rounding.
    int compare(double a, double b) const {
        const PriceTicks ta = to_ticks(a);
        const PriceTicks tb = to_ticks(b);
        return (ta > tb) - (ta < tb);
    }

    double scale_factor() const { return scale_factor_; }

    /// Scales must be positive and finite; anything else breaks tick comparison.
    static bool valid_scale(double scale) { return scale > 0.0 && std::isfinite(scale); }

private:
    double scale_factor_;
    double inv_scale_;
};

/// Per-symbol registry of price converters.
class PriceConverterRegistry {
public:
    explicit PriceConverterRegistry(double default_scale = 10000.0)
        : default_(default_scale)
    {}

    /// Returns false and keeps the previous scale when scale is not valid.
    bool set_scale(const std::string& symbol, double scale) {
        if (!PriceConverter::valid_scale(scale)) return false;
        converters_.insert_or_assign(symbol, PriceConverter(scale));
        return true;
    }

    const PriceConverter& get(const std::string& symbol) const {
        auto it = converters_.find(symbol);
        if (it != converters_.end()) {
            return it->second;
        }
        return default_;
    }

private:
    PriceConverter default_;
    std::unordered_map<std::string, PriceConverter> converters_;
};

} // namespace impactflow
