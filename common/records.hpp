#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/book_snapshot.hpp"

namespace impactflow {

using LevelVector = std::array<double, kMaxLevels>;

enum class DataIssue : uint8_t {
    MISSING_LEVEL_DATA,
    NON_MONOTONIC_TIMESTAMP,
    INVALID_BOOK,
    SYMBOL_MISMATCH,
    INSUFFICIENT_HISTORY,
    SINGULAR_DESIGN_MATRIX
};

enum class UnitStatus : uint8_t {
    OK,
    INSUFFICIENT_HISTORY,
    ZERO_VARIANCE,
    SINGULAR_DESIGN
};

enum class ImpactMode : uint8_t {
    CONTEMPORANEOUS,
    LAGGED
};

enum class ReturnConvention : uint8_t {
    LOG_RETURN,
    PRICE_DIFFERENCE
};

inline const char* data_issue_to_string(DataIssue issue) {
    switch (issue) {
        case DataIssue::MISSING_LEVEL_DATA:      return "MissingLevelData";
        case DataIssue::NON_MONOTONIC_TIMESTAMP: return "NonMonotonicTimestamp";
        case DataIssue::INVALID_BOOK:            return "InvalidBook";
        case DataIssue::SYMBOL_MISMATCH:         return "SymbolMismatch";
        case DataIssue::INSUFFICIENT_HISTORY:    return "InsufficientHistory";
        case DataIssue::SINGULAR_DESIGN_MATRIX:  return "SingularDesignMatrix";
    }
    return "UNKNOWN";
}

inline const char* status_to_string(UnitStatus s) {
    switch (s) {
        case UnitStatus::OK:                   return "OK";
        case UnitStatus::INSUFFICIENT_HISTORY: return "INSUFFICIENT_HISTORY";
        case UnitStatus::ZERO_VARIANCE:        return "ZERO_VARIANCE";
        case UnitStatus::SINGULAR_DESIGN:      return "SINGULAR_DESIGN";
    }
    return "UNKNOWN";
}

inline const char* mode_to_string(ImpactMode m) {
    switch (m) {
        case ImpactMode::CONTEMPORANEOUS: return "CONTEMPORANEOUS";
        case ImpactMode::LAGGED:          return "LAGGED";
    }
    return "UNKNOWN";
}

inline const char* convention_to_string(ReturnConvention c) {
    switch (c) {
        case ReturnConvention::LOG_RETURN:       return "LOG_RETURN";
        case ReturnConvention::PRICE_DIFFERENCE: return "PRICE_DIFFERENCE";
    }
    return "UNKNOWN";
}

// --- Per-symbol OFI ---

struct LevelOFIRecord {
    std::string symbol;
    int64_t timestamp_us;
    LevelVector ofi;
    uint8_t levels_reported;   // min depth of the two snapshots, for MissingLevelData
};

/// Counters for snapshots dropped or degraded while building a series.
struct SeriesDiagnostics {
    size_t snapshots_in = 0;
    size_t snapshots_used = 0;
    size_t rejected_non_monotonic = 0;
    size_t rejected_invalid_book = 0;
    size_t rejected_symbol_mismatch = 0;
    size_t short_book_snapshots = 0;

    size_t rejected_total() const {
        return rejected_non_monotonic + rejected_invalid_book + rejected_symbol_mismatch;
    }
};

struct LevelOFISeries {
    std::string symbol;
    std::vector<LevelOFIRecord> records;
    SeriesDiagnostics diagnostics;
};

struct CompositeOFIRecord {
    std::string symbol;
    int64_t timestamp_us;
    double score;
    LevelVector loadings;
    double explained_variance;
    bool low_fidelity;
};

/// Fitted projection for one symbol plus the scores it produced.
/// records is empty unless status == OK.
struct CompositeOFISeries {
    std::string symbol;
    UnitStatus status = UnitStatus::INSUFFICIENT_HISTORY;
    size_t observations = 0;
    LevelVector loadings{};
    LevelVector level_mean{};
    LevelVector level_stddev{};
    double eigenvalue = 0.0;
    double explained_variance = 0.0;
    bool low_fidelity = false;
    std::vector<CompositeOFIRecord> records;

    bool ok() const { return status == UnitStatus::OK; }
};

// --- Returns ---

struct PriceChangeRecord {
    std::string symbol;
    int64_t timestamp_us;
    int64_t horizon_us;
    double value;
};

struct PriceChangeSeries {
    std::string symbol;
    int64_t horizon_us = 0;
    ReturnConvention convention = ReturnConvention::LOG_RETURN;
    std::vector<PriceChangeRecord> records;
};

// --- Cross-sectional ---

struct DesignRow {
    int64_t timestamp_us;
    std::string target_symbol;
    double target_return;
    double self_ofi;
    std::map<std::string, double> cross_ofi;
};

struct DesignMatrix {
    std::string target_symbol;
    int64_t horizon_us = 0;
    ImpactMode mode = ImpactMode::CONTEMPORANEOUS;
    std::vector<std::string> cross_symbols;   // regressor order after the self term
    std::vector<DesignRow> rows;
    size_t candidate_rows = 0;
    size_t dropped_rows = 0;
};

struct RegressionResult {
    std::string target_symbol;
    int64_t horizon_us = 0;
    ImpactMode mode = ImpactMode::CONTEMPORANEOUS;
    UnitStatus status = UnitStatus::INSUFFICIENT_HISTORY;
    double intercept = 0.0;
    double self_coefficient = 0.0;
    std::map<std::string, double> cross_coefficients;
    std::optional<double> r_squared;
    std::optional<double> adjusted_r_squared;
    std::optional<double> dominance_ratio;
    double residual_std = 0.0;
    size_t observations = 0;
    size_t regressors = 0;

    bool ok() const { return status == UnitStatus::OK; }
};

} // namespace impactflow
