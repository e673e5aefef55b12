#pragma once

#include <string>
#include <vector>

#include "common/records.hpp"
#include "common/stage_profiler.hpp"
#include "impact/impact_matrix.hpp"

namespace impactflow {

/// Every function returns one JSON line (no trailing newline) of the form
/// { "type": <kind>, "data": {...} }. Field names follow the record fields;
/// NaN, infinities and empty optionals are written as null.

/// { "type": "composite_ofi", "data": { "symbol", "status", "loadings", ..., "records": [...] } }
std::string serialize_composite(const CompositeOFISeries& series);

/// { "type": "price_changes", "data": { "symbol", "horizon_us", "convention", "records": [...] } }
std::string serialize_price_changes(const PriceChangeSeries& series);

/// { "type": "regression", "data": {...} }
std::string serialize_regression(const RegressionResult& result);

/// { "type": "impact_matrix", "data": { "symbols": [...], "coefficients": [[...]], "r_squared": [...] } }
std::string serialize_impact_matrix(const CrossImpactMatrix& matrix);

/// { "type": "profile", "data": { "stages": [...] } }
std::string serialize_profile(const std::vector<StageStats>& stages);

} // namespace impactflow
