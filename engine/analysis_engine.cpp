#include "engine/analysis_engine.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include "common/log.hpp"
#include "engine/job_system.hpp"
#include "impact/design_builder.hpp"
#include "impact/regression.hpp"
#include "ofi/composite_ofi.hpp"
#include "ofi/level_ofi.hpp"
#include "returns/price_change.hpp"

namespace impactflow {

namespace {

constexpr ImpactMode kModes[] = {ImpactMode::CONTEMPORANEOUS, ImpactMode::LAGGED};

} // namespace

// --- AnalysisReport lookups ---

const SymbolAnalysis* AnalysisReport::symbol(const std::string& name) const {
    auto it = std::lower_bound(symbols.begin(), symbols.end(), name,
        [](const SymbolAnalysis& s, const std::string& n) { return s.symbol < n; });
    return (it != symbols.end() && it->symbol == name) ? &*it : nullptr;
}

const RegressionResult* AnalysisReport::regression(const std::string& target, int64_t horizon_us,
                                                   ImpactMode mode) const {
    for (const auto& r : regressions) {
        if (r.target_symbol == target && r.horizon_us == horizon_us && r.mode == mode) return &r;
    }
    return nullptr;
}

const CrossImpactMatrix* AnalysisReport::impact_matrix(int64_t horizon_us, ImpactMode mode) const {
    for (const auto& m : impact_matrices) {
        if (m.horizon_us == horizon_us && m.mode == mode) return &m;
    }
    return nullptr;
}

size_t AnalysisReport::failed_units() const {
    return static_cast<size_t>(std::count_if(regressions.begin(), regressions.end(),
        [](const RegressionResult& r) { return !r.ok(); }));
}

// --- AnalysisEngine ---

AnalysisEngine::AnalysisEngine(AnalysisConfig config)
    : config_(std::move(config)),
      price_scales_(config_.price_scale) {}

void AnalysisEngine::add_symbol(const std::string& symbol, std::vector<BookSnapshot> snapshots) {
    auto& dst = inputs_[symbol];
    if (dst.empty()) {
        dst = std::move(snapshots);
    } else {
        dst.insert(dst.end(), std::make_move_iterator(snapshots.begin()),
                   std::make_move_iterator(snapshots.end()));
    }
}

bool AnalysisEngine::set_price_scale(const std::string& symbol, double scale) {
    if (!price_scales_.set_scale(symbol, scale)) {
        log_warn("AnalysisEngine", "%s: ignoring price scale %g, must be positive and finite",
                 symbol.c_str(), scale);
        return false;
    }
    return true;
}

std::vector<BookSnapshot> AnalysisEngine::windowed(const std::vector<BookSnapshot>& snapshots) const {
    if (!config_.window_start_us && !config_.window_end_us) return snapshots;
    const int64_t lo = config_.window_start_us.value_or(std::numeric_limits<int64_t>::min());
    const int64_t hi = config_.window_end_us.value_or(std::numeric_limits<int64_t>::max());

    std::vector<BookSnapshot> out;
    out.reserve(snapshots.size());
    for (const auto& s : snapshots) {
        if (s.timestamp_us >= lo && s.timestamp_us <= hi) out.push_back(s);
    }
    return out;
}

TimeGrid AnalysisEngine::build_grid() const {
    int64_t lo = std::numeric_limits<int64_t>::max();
    int64_t hi = std::numeric_limits<int64_t>::min();
    for (const auto& [sym, snaps] : inputs_) {
        (void)sym;
        for (const auto& s : snaps) {
            lo = std::min(lo, s.timestamp_us);
            hi = std::max(hi, s.timestamp_us);
        }
    }
    if (config_.window_start_us) lo = *config_.window_start_us;
    if (config_.window_end_us) hi = *config_.window_end_us;
    if (lo > hi) return TimeGrid{};
    return TimeGrid::covering(lo, hi, config_.grid_step_us);
}

SymbolAnalysis AnalysisEngine::analyze_symbol(const std::string& symbol,
                                              const std::vector<BookSnapshot>& snapshots,
                                              const TimeGrid& grid) {
    SymbolAnalysis out;
    out.symbol = symbol;

    auto t0 = Timer::now();
    const FilteredSnapshots filtered = filter_snapshots(symbol, windowed(snapshots));
    const LevelOFICalculator calculator(price_scales_.get(symbol));
    LevelOFISeries event_ofi = calculator.compute_series(filtered);
    out.level_ofi = config_.aggregate_ofi_to_grid ? aggregate_to_grid(event_ofi, grid)
                                                  : std::move(event_ofi);
    auto t1 = Timer::now();

    const CompositeOFIReducer reducer(config_.min_pca_observations, config_.low_fidelity_threshold);
    out.composite = reducer.fit_transform(out.level_ofi);
    auto t2 = Timer::now();

    const PriceChangeComputer returns(config_.return_convention);
    out.price_changes = returns.compute_all(symbol, filtered.accepted, grid, config_.horizons_us);
    auto t3 = Timer::now();

    profiler_.record("level_ofi", Timer::elapsed_ms(t0, t1));
    profiler_.record("composite_ofi", Timer::elapsed_ms(t1, t2));
    profiler_.record("price_change", Timer::elapsed_ms(t2, t3));
    return out;
}

bool AnalysisEngine::run(AnalysisReport& report, std::string& error) {
    report = AnalysisReport{};
    if (!config_.validate(error)) {
        log_error("AnalysisEngine", "invalid configuration: %s", error.c_str());
        return false;
    }

    const auto run_start = Timer::now();
    const TimeGrid grid = build_grid();
    if (grid.empty()) {
        error = "no snapshots inside the analysis window";
        log_error("AnalysisEngine", "%s", error.c_str());
        return false;
    }
    report.grid = grid;

    const JobSystem jobs(config_.threads);
    log_info("AnalysisEngine", "%zu symbol(s), %zu grid point(s) of %llds, %u worker(s)",
             inputs_.size(), grid.count,
             static_cast<long long>(grid.step_us / kMicrosPerSecond), jobs.thread_count());

    // ── Stage 1: independent per-symbol work ──
    std::vector<const std::pair<const std::string, std::vector<BookSnapshot>>*> inputs;
    inputs.reserve(inputs_.size());
    for (const auto& entry : inputs_) inputs.push_back(&entry);

    report.symbols.resize(inputs.size());
    {
        ScopedStage stage(profiler_, "per_symbol_stage");
        jobs.parallel_for(inputs.size(), [&](size_t i) {
            report.symbols[i] = analyze_symbol(inputs[i]->first, inputs[i]->second, grid);
        });
    }
    // parallel_for has joined every worker: all composites are final from here on.

    std::vector<CompositeOFISeries> composites;
    composites.reserve(report.symbols.size());
    for (const auto& s : report.symbols) {
        composites.push_back(s.composite);
        if (!s.composite.ok()) {
            log_warn("AnalysisEngine", "%s left out of the cross-section: composite %s",
                     s.symbol.c_str(), status_to_string(s.composite.status));
        }
    }

    // ── Stage 2: cross-sectional designs and fits ──
    const CrossImpactDesignBuilder builder(composites, report.grid.step_us);
    const RegressionEngine regression(config_.rank_tolerance);
    const size_t n_horizons = config_.horizons_us.size();
    const size_t n_modes = sizeof(kModes) / sizeof(kModes[0]);
    const size_t n_units = report.symbols.size() * n_horizons * n_modes;

    report.regressions.resize(n_units);
    {
        ScopedStage stage(profiler_, "cross_section_stage");
        jobs.parallel_for(n_units, [&](size_t u) {
            const size_t s = u / (n_horizons * n_modes);
            const size_t h = (u / n_modes) % n_horizons;
            const ImpactMode mode = kModes[u % n_modes];

            const auto& returns = report.symbols[s].price_changes[h];
            const DesignMatrix design = builder.build(returns, mode);
            report.regressions[u] = regression.fit(design);
        });
    }

    for (int64_t h : config_.horizons_us) {
        for (ImpactMode mode : kModes) {
            std::vector<std::string> names;
            names.reserve(report.symbols.size());
            for (const auto& s : report.symbols) names.push_back(s.symbol);
            report.impact_matrices.push_back(build_impact_matrix(report.regressions, names, h, mode));
        }
    }

    profiler_.record("total", Timer::elapsed_ms(run_start, Timer::now()));
    report.timings = profiler_.all_stats();

    log_info("AnalysisEngine", "%zu unit(s) fitted, %zu failed",
             report.regressions.size() - report.failed_units(), report.failed_units());
    return true;
}

} // namespace impactflow
