#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace impactflow {

// ═══════════════════════════════════════════════
// High-Resolution Timer
// ═══════════════════════════════════════════════
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    static TimePoint now() { return Clock::now(); }

    static double elapsed_ms(TimePoint start, TimePoint end) {
        return std::chrono::duration<double, std::milli>(end - start).count();
    }
};

// ═══════════════════════════════════════════════
// Stage Stats
// ═══════════════════════════════════════════════
struct StageStats {
    std::string name;
    double last_ms = 0.0;
    double total_ms = 0.0;
    double min_ms = 1e18;
    double max_ms = 0.0;
    uint64_t call_count = 0;

    void record(double ms) {
        last_ms = ms;
        total_ms += ms;
        if (ms < min_ms) min_ms = ms;
        if (ms > max_ms) max_ms = ms;
        call_count++;
    }

    double avg_ms() const { return call_count ? total_ms / static_cast<double>(call_count) : 0.0; }
};

// ═══════════════════════════════════════════════
// StageProfiler: one per batch run
// ═══════════════════════════════════════════════
class StageProfiler {
public:
    void begin_stage(const std::string& name);
    void end_stage(const std::string& name);
    void record(const std::string& name, double ms);

    /// Copy of one stage's stats, taken under the lock.
    std::optional<StageStats> stats(const std::string& name) const;

    /// Snapshot of all stages, sorted by name.
    std::vector<StageStats> all_stats() const;

    void print_report(std::ostream& out) const;

    void set_enabled(bool on) { enabled_.store(on, std::memory_order_relaxed); }
    bool enabled() const { return enabled_.load(std::memory_order_relaxed); }

private:
    std::unordered_map<std::string, StageStats> stats_;
    std::unordered_map<std::string, Timer::TimePoint> active_;
    mutable std::mutex mutex_;
    std::atomic<bool> enabled_{true};
};

// ═══════════════════════════════════════════════
// RAII Scoped Marker, usage:
//     ScopedStage stage(profiler, "composite_ofi");
// ═══════════════════════════════════════════════
class ScopedStage {
public:
    ScopedStage(StageProfiler& profiler, std::string name)
        : profiler_(profiler), name_(std::move(name)) {
        profiler_.begin_stage(name_);
    }
    ~ScopedStage() { profiler_.end_stage(name_); }

    ScopedStage(const ScopedStage&) = delete;
    ScopedStage& operator=(const ScopedStage&) = delete;

private:
    StageProfiler& profiler_;
    std::string name_;
};

} // namespace impactflow
