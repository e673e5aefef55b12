#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "common/analysis_config.hpp"
#include "common/arg_parse.hpp"
#include "common/log.hpp"
#include "engine/analysis_engine.hpp"
#include "io/json_serializer.hpp"
#include "io/snapshot_csv.hpp"

namespace fs = std::filesystem;

constexpr uint64_t kMaxThreads = 1024;

struct Config {
    std::string data_dir = "data";
    std::vector<std::string> symbols;   // empty = every <data-dir>/*.csv
    std::string output;                 // empty = stdout
    bool quiet = false;
    bool profile = false;
    impactflow::AnalysisConfig analysis;
};

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "  --data-dir DIR          snapshot CSVs, one <SYMBOL>.csv per symbol (default: data)\n"
        "  --symbols A,B,...       symbols to load (default: every CSV in DIR)\n"
        "  --grid-sec N            sampling grid step in seconds (default: 60)\n"
        "  --horizons H1,H2,...    return horizons in seconds (default: 60,300)\n"
        "  --returns log|diff      log return or mid-price difference (default: log)\n"
        "  --no-grid-aggregation   fit the composite on event-time OFI\n"
        "  --threads N             worker threads (0..1024), 0 = hardware concurrency\n"
        "  --min-obs N             minimum OFI observations for the composite (default: 3)\n"
        "  --fidelity X            low-fidelity explained-variance threshold (default: 0.5)\n"
        "  --price-scale X         ticks per price unit for level comparison (default: 10000)\n"
        "  --output FILE           JSON-lines output (default: stdout)\n"
        "  --quiet                 suppress progress output\n"
        "  --profile               print the stage timing report\n",
        prog);
}

static bool parse_args(int argc, char* argv[], Config& cfg, std::string& error) {
    using impactflow::parse_count;
    using impactflow::parse_number;
    using impactflow::parse_seconds_us;
    using impactflow::split_list;

    for (int i = 1; i < argc; ++i) {
        const char* flag = argv[i];
        const bool has_value = i + 1 < argc;
        double num = 0.0;
        uint64_t count = 0;
        int64_t us = 0;

        if (std::strcmp(flag, "--quiet") == 0) {
            cfg.quiet = true;
        } else if (std::strcmp(flag, "--profile") == 0) {
            cfg.profile = true;
        } else if (std::strcmp(flag, "--no-grid-aggregation") == 0) {
            cfg.analysis.aggregate_ofi_to_grid = false;
        } else if (std::strcmp(flag, "--data-dir") == 0 && has_value) {
            cfg.data_dir = argv[++i];
        } else if (std::strcmp(flag, "--symbols") == 0 && has_value) {
            cfg.symbols = split_list(argv[++i]);
        } else if (std::strcmp(flag, "--output") == 0 && has_value) {
            cfg.output = argv[++i];
        } else if (std::strcmp(flag, "--grid-sec") == 0 && has_value) {
            if (!parse_seconds_us(argv[++i], us)) { error = "bad --grid-sec"; return false; }
            cfg.analysis.grid_step_us = us;
        } else if (std::strcmp(flag, "--horizons") == 0 && has_value) {
            cfg.analysis.horizons_us.clear();
            for (const auto& h : split_list(argv[++i])) {
                if (!parse_seconds_us(h.c_str(), us)) { error = "bad --horizons entry: " + h; return false; }
                cfg.analysis.horizons_us.push_back(us);
            }
        } else if (std::strcmp(flag, "--returns") == 0 && has_value) {
            const char* v = argv[++i];
            if (std::strcmp(v, "log") == 0) {
                cfg.analysis.return_convention = impactflow::ReturnConvention::LOG_RETURN;
            } else if (std::strcmp(v, "diff") == 0) {
                cfg.analysis.return_convention = impactflow::ReturnConvention::PRICE_DIFFERENCE;
            } else {
                error = std::string("bad --returns value: ") + v;
                return false;
            }
        } else if (std::strcmp(flag, "--threads") == 0 && has_value) {
            if (!parse_count(argv[++i], kMaxThreads, count)) { error = "bad --threads"; return false; }
            cfg.analysis.threads = static_cast<unsigned>(count);
        } else if (std::strcmp(flag, "--min-obs") == 0 && has_value) {
            if (!parse_count(argv[++i], SIZE_MAX, count)) { error = "bad --min-obs"; return false; }
            cfg.analysis.min_pca_observations = static_cast<size_t>(count);
        } else if (std::strcmp(flag, "--fidelity") == 0 && has_value) {
            if (!parse_number(argv[++i], num)) { error = "bad --fidelity"; return false; }
            cfg.analysis.low_fidelity_threshold = num;
        } else if (std::strcmp(flag, "--price-scale") == 0 && has_value) {
            if (!parse_number(argv[++i], num)) { error = "bad --price-scale"; return false; }
            cfg.analysis.price_scale = num;
        } else {
            error = std::string("unknown or incomplete option: ") + flag;
            return false;
        }
    }
    return cfg.analysis.validate(error);
}

static bool discover_symbols(Config& cfg, std::string& error) {
    std::error_code ec;
    if (!fs::is_directory(cfg.data_dir, ec)) {
        error = "data directory not readable: " + cfg.data_dir;
        return false;
    }
    if (!cfg.symbols.empty()) return true;

    for (const auto& entry : fs::directory_iterator(cfg.data_dir, ec)) {
        std::error_code file_ec;
        if (entry.is_regular_file(file_ec) && entry.path().extension() == ".csv") {
            cfg.symbols.push_back(entry.path().stem().string());
        }
    }
    if (ec) {
        error = "cannot list " + cfg.data_dir + ": " + ec.message();
        return false;
    }
    std::sort(cfg.symbols.begin(), cfg.symbols.end());
    return true;
}

static void write_report(std::ostream& out, const impactflow::AnalysisReport& report, bool profile) {
    for (const auto& s : report.symbols) {
        out << impactflow::serialize_composite(s.composite) << '\n';
        for (const auto& pc : s.price_changes) out << impactflow::serialize_price_changes(pc) << '\n';
    }
    for (const auto& r : report.regressions) out << impactflow::serialize_regression(r) << '\n';
    for (const auto& m : report.impact_matrices) out << impactflow::serialize_impact_matrix(m) << '\n';
    if (profile) out << impactflow::serialize_profile(report.timings) << '\n';
}

static void print_summary(const impactflow::AnalysisReport& report) {
    using impactflow::kMicrosPerSecond;

    std::printf("\n%-12s %8s %10s %8s\n", "symbol", "obs", "expl.var", "status");
    for (const auto& s : report.symbols) {
        const auto& c = s.composite;
        std::printf("%-12s %8zu %10.4f %8s%s\n", s.symbol.c_str(), c.observations,
                    c.explained_variance, impactflow::status_to_string(c.status),
                    c.low_fidelity ? " (low fidelity)" : "");
    }

    std::printf("\n%-12s %6s %-16s %10s %8s %10s\n", "target", "h(s)", "mode", "self", "R2", "dominance");
    for (const auto& r : report.regressions) {
        const long long h = static_cast<long long>(r.horizon_us / kMicrosPerSecond);
        if (!r.ok()) {
            std::printf("%-12s %6lld %-16s %s\n", r.target_symbol.c_str(), h,
                        impactflow::mode_to_string(r.mode), impactflow::status_to_string(r.status));
            continue;
        }
        std::printf("%-12s %6lld %-16s %10.4g %8.4f %10.4g\n", r.target_symbol.c_str(), h,
                    impactflow::mode_to_string(r.mode), r.self_coefficient,
                    r.r_squared.value_or(0.0), r.dominance_ratio.value_or(0.0));
    }
}

int main(int argc, char* argv[]) {
    Config cfg;
    std::string error;
    if (!parse_args(argc, argv, cfg, error)) {
        std::fprintf(stderr, "[impactflow] error: %s\n", error.c_str());
        print_usage(argv[0]);
        return 1;
    }
    // JSON lines on stdout must not interleave with progress output.
    impactflow::set_log_verbose(!cfg.quiet && !cfg.output.empty());

    if (!discover_symbols(cfg, error)) {
        std::fprintf(stderr, "[impactflow] error: %s\n", error.c_str());
        return 1;
    }

    impactflow::log_info("impactflow", "ImpactFlow cross-impact analysis");
    impactflow::AnalysisEngine engine(cfg.analysis);
    engine.profiler().set_enabled(cfg.profile);

    for (const auto& sym : cfg.symbols) {
        const std::string path = (fs::path(cfg.data_dir) / (sym + ".csv")).string();
        std::vector<impactflow::BookSnapshot> snapshots;
        impactflow::CsvLoadStats stats;
        std::string load_error;
        if (!impactflow::load_snapshot_csv(path, snapshots, stats, load_error)) {
            impactflow::log_warn("impactflow", "skipping %s: %s", sym.c_str(), load_error.c_str());
            continue;
        }
        if (snapshots.empty()) {
            impactflow::log_warn("impactflow", "skipping %s: no rows", sym.c_str());
            continue;
        }
        engine.add_symbol(sym, std::move(snapshots));
    }

    if (engine.symbol_count() == 0) {
        std::fprintf(stderr, "[impactflow] error: no symbol with data in %s\n", cfg.data_dir.c_str());
        return 1;
    }

    impactflow::AnalysisReport report;
    if (!engine.run(report, error)) {
        std::fprintf(stderr, "[impactflow] error: %s\n", error.c_str());
        return 1;
    }

    if (cfg.output.empty()) {
        write_report(std::cout, report, cfg.profile);
    } else {
        std::ofstream out(cfg.output);
        if (!out.is_open()) {
            std::fprintf(stderr, "[impactflow] error: cannot write %s\n", cfg.output.c_str());
            return 1;
        }
        write_report(out, report, cfg.profile);
        if (!cfg.quiet) print_summary(report);
    }

    if (cfg.profile) engine.profiler().print_report(std::cerr);

    impactflow::log_info("impactflow", "%zu symbol(s), %zu unit(s), %zu failed",
                         report.symbols.size(), report.regressions.size(), report.failed_units());
    return 0;
}
