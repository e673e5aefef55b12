#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/analysis_config.hpp"
#include "common/book_snapshot.hpp"
#include "common/price_converter.hpp"
#include "common/records.hpp"
#include "common/stage_profiler.hpp"
#include "common/time_grid.hpp"
#include "impact/impact_matrix.hpp"

namespace impactflow {

/// Everything the per-symbol stage produced for one symbol.
struct SymbolAnalysis {
    std::string symbol;
    LevelOFISeries level_ofi;                    // the series the PCA was fitted on
    CompositeOFISeries composite;
    std::vector<PriceChangeSeries> price_changes; // one per configured horizon, same order
};

struct AnalysisReport {
    TimeGrid grid;
    std::vector<SymbolAnalysis> symbols;          // sorted by symbol
    std::vector<RegressionResult> regressions;    // target x horizon x mode
    std::vector<CrossImpactMatrix> impact_matrices; // horizon x mode
    std::vector<StageStats> timings;

    const SymbolAnalysis* symbol(const std::string& name) const;
    const RegressionResult* regression(const std::string& target, int64_t horizon_us,
                                       ImpactMode mode) const;
    const CrossImpactMatrix* impact_matrix(int64_t horizon_us, ImpactMode mode) const;

    size_t failed_units() const;
};

/// Batch driver for the whole pipeline.
///
/// Stage 1 runs per symbol on the job system: snapshot checks, level OFI,
/// optional grid aggregation, PCA composite and forward returns. parallel_for
/// joins every worker before stage 2, which builds one design per
/// (target, horizon, mode) and fits it. Unit failures are reported in the
/// results and never stop the batch.
class AnalysisEngine {
public:
    explicit AnalysisEngine(AnalysisConfig config = AnalysisConfig());

    /// Appends snapshots for a symbol; repeated calls for one symbol concatenate.
    void add_symbol(const std::string& symbol, std::vector<BookSnapshot> snapshots);

    /// Tick scale used when comparing this symbol's prices. False for a
    /// non-positive or non-finite scale, which is ignored.
    bool set_price_scale(const std::string& symbol, double scale);

    size_t symbol_count() const { return inputs_.size(); }
    const AnalysisConfig& config() const { return config_; }
    StageProfiler& profiler() { return profiler_; }

    /// False (with error filled) only for an invalid config or an empty grid.
    bool run(AnalysisReport& report, std::string& error);

private:
    TimeGrid build_grid() const;
    std::vector<BookSnapshot> windowed(const std::vector<BookSnapshot>& snapshots) const;
    SymbolAnalysis analyze_symbol(const std::string& symbol,
                                  const std::vector<BookSnapshot>& snapshots,
                                  const TimeGrid& grid);

    AnalysisConfig config_;
    PriceConverterRegistry price_scales_;
    std::map<std::string, std::vector<BookSnapshot>> inputs_;
    StageProfiler profiler_;
};

} // namespace impactflow
