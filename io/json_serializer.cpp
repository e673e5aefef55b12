#include "io/json_serializer.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <string_view>

namespace impactflow {

namespace {

inline void append_u64(std::string& out, uint64_t value) {
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec == std::errc()) {
        out.append(buf, ptr);
    } else {
        out += "0";
    }
}

inline void append_i64(std::string& out, int64_t value) {
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec == std::errc()) {
        out.append(buf, ptr);
    } else {
        out += "0";
    }
}

inline void append_double(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }

    char buf[64];
    int n = std::snprintf(buf, sizeof(buf), "%.12g", value);
    if (n <= 0) {
        out += "null";
        return;
    }
    const int len = (n < static_cast<int>(sizeof(buf))) ? n : static_cast<int>(sizeof(buf) - 1);
    out.append(buf, static_cast<size_t>(len));
}

inline void append_optional(std::string& out, const std::optional<double>& value) {
    if (value) {
        append_double(out, *value);
    } else {
        out += "null";
    }
}

inline void append_bool(std::string& out, bool value) {
    out += value ? "true" : "false";
}

inline void append_json_string(std::string& out, std::string_view value) {
    out.push_back('"');
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char esc[7];
                    std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned int>(
                        static_cast<unsigned char>(c)));
                    out += esc;
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

inline void append_levels(std::string& out, const LevelVector& v) {
    out.push_back('[');
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0) out.push_back(',');
        append_double(out, v[i]);
    }
    out.push_back(']');
}

inline void begin_envelope(std::string& out, const char* type) {
    out += "{\"type\":";
    append_json_string(out, type);
    out += ",\"data\":{";
}

} // namespace

std::string serialize_composite(const CompositeOFISeries& series) {
    std::string out;
    out.reserve(384 + series.records.size() * 48);

    begin_envelope(out, "composite_ofi");
    out += "\"symbol\":";
    append_json_string(out, series.symbol);
    out += ",\"status\":";
    append_json_string(out, status_to_string(series.status));
    out += ",\"observations\":";
    append_u64(out, series.observations);
    out += ",\"loadings\":";
    append_levels(out, series.loadings);
    out += ",\"level_mean\":";
    append_levels(out, series.level_mean);
    out += ",\"level_stddev\":";
    append_levels(out, series.level_stddev);
    out += ",\"eigenvalue\":";
    append_double(out, series.eigenvalue);
    out += ",\"explained_variance\":";
    append_double(out, series.explained_variance);
    out += ",\"low_fidelity\":";
    append_bool(out, series.low_fidelity);
    out += ",\"records\":[";

    for (size_t i = 0; i < series.records.size(); ++i) {
        const auto& r = series.records[i];
        if (i > 0) out.push_back(',');
        out += "{\"timestamp_us\":";
        append_i64(out, r.timestamp_us);
        out += ",\"score\":";
        append_double(out, r.score);
        out.push_back('}');
    }

    out += "]}}";
    return out;
}

std::string serialize_price_changes(const PriceChangeSeries& series) {
    std::string out;
    out.reserve(192 + series.records.size() * 48);

    begin_envelope(out, "price_changes");
    out += "\"symbol\":";
    append_json_string(out, series.symbol);
    out += ",\"horizon_us\":";
    append_i64(out, series.horizon_us);
    out += ",\"convention\":";
    append_json_string(out, convention_to_string(series.convention));
    out += ",\"records\":[";

    for (size_t i = 0; i < series.records.size(); ++i) {
        const auto& r = series.records[i];
        if (i > 0) out.push_back(',');
        out += "{\"timestamp_us\":";
        append_i64(out, r.timestamp_us);
        out += ",\"value\":";
        append_double(out, r.value);
        out.push_back('}');
    }

    out += "]}}";
    return out;
}

std::string serialize_regression(const RegressionResult& result) {
    std::string out;
    out.reserve(384 + result.cross_coefficients.size() * 48);

    begin_envelope(out, "regression");
    out += "\"target_symbol\":";
    append_json_string(out, result.target_symbol);
    out += ",\"horizon_us\":";
    append_i64(out, result.horizon_us);
    out += ",\"mode\":";
    append_json_string(out, mode_to_string(result.mode));
    out += ",\"status\":";
    append_json_string(out, status_to_string(result.status));

    // Coefficients only carry meaning for a successful fit.
    const bool ok = result.ok();
    out += ",\"intercept\":";
    if (ok) append_double(out, result.intercept); else out += "null";
    out += ",\"self_coefficient\":";
    if (ok) append_double(out, result.self_coefficient); else out += "null";
    out += ",\"cross_coefficients\":{";
    bool first = true;
    for (const auto& [source, coef] : result.cross_coefficients) {
        if (!first) out.push_back(',');
        first = false;
        append_json_string(out, source);
        out.push_back(':');
        append_double(out, coef);
    }
    out += "},\"r_squared\":";
    append_optional(out, result.r_squared);
    out += ",\"adjusted_r_squared\":";
    append_optional(out, result.adjusted_r_squared);
    out += ",\"dominance_ratio\":";
    append_optional(out, result.dominance_ratio);
    out += ",\"residual_std\":";
    if (ok) append_double(out, result.residual_std); else out += "null";
    out += ",\"observations\":";
    append_u64(out, result.observations);
    out += ",\"regressors\":";
    append_u64(out, result.regressors);
    out += "}}";
    return out;
}

std::string serialize_impact_matrix(const CrossImpactMatrix& matrix) {
    const size_t n = matrix.size();
    std::string out;
    out.reserve(192 + n * 24 + n * n * 20);

    begin_envelope(out, "impact_matrix");
    out += "\"horizon_us\":";
    append_i64(out, matrix.horizon_us);
    out += ",\"mode\":";
    append_json_string(out, mode_to_string(matrix.mode));
    out += ",\"symbols\":[";
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) out.push_back(',');
        append_json_string(out, matrix.symbols[i]);
    }

    out += "],\"coefficients\":[";
    for (size_t i = 0; i < matrix.coefficients.size(); ++i) {
        if (i > 0) out.push_back(',');
        out.push_back('[');
        const auto& row = matrix.coefficients[i];
        for (size_t j = 0; j < row.size(); ++j) {
            if (j > 0) out.push_back(',');
            append_double(out, row[j]);
        }
        out.push_back(']');
    }

    out += "],\"r_squared\":[";
    for (size_t i = 0; i < matrix.r_squared.size(); ++i) {
        if (i > 0) out.push_back(',');
        append_optional(out, matrix.r_squared[i]);
    }
    out += "]}}";
    return out;
}

std::string serialize_profile(const std::vector<StageStats>& stages) {
    std::string out;
    out.reserve(64 + stages.size() * 128);

    begin_envelope(out, "profile");
    out += "\"stages\":[";
    for (size_t i = 0; i < stages.size(); ++i) {
        const auto& s = stages[i];
        if (i > 0) out.push_back(',');
        out += "{\"name\":";
        append_json_string(out, s.name);
        out += ",\"calls\":";
        append_u64(out, s.call_count);
        out += ",\"total_ms\":";
        append_double(out, s.total_ms);
        out += ",\"avg_ms\":";
        append_double(out, s.avg_ms());
        out += ",\"min_ms\":";
        append_double(out, s.call_count ? s.min_ms : 0.0);
        out += ",\"max_ms\":";
        append_double(out, s.max_ms);
        out.push_back('}');
    }
    out += "]}}";
    return out;
}

} // namespace impactflow
