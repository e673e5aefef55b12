#include "common/stage_profiler.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>

namespace impactflow {

// ═══════════════════════════════════════════════
// Begin / End
// ═══════════════════════════════════════════════
void StageProfiler::begin_stage(const std::string& name) {
    if (!enabled()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    active_[name] = Timer::now();
}

void StageProfiler::end_stage(const std::string& name) {
    if (!enabled()) return;
    auto end = Timer::now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(name);
    if (it == active_.end()) return;

    double ms = Timer::elapsed_ms(it->second, end);
    active_.erase(it);

    auto& s = stats_[name];
    s.name = name;
    s.record(ms);
}

void StageProfiler::record(const std::string& name, double ms) {
    if (!enabled()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto& s = stats_[name];
    s.name = name;
    s.record(ms);
}

// ═══════════════════════════════════════════════
// Query
// ═══════════════════════════════════════════════
std::optional<StageStats> StageProfiler::stats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(name);
    if (it == stats_.end()) return std::nullopt;
    return it->second;
}

std::vector<StageStats> StageProfiler::all_stats() const {
    std::vector<StageStats> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(stats_.size());
        for (const auto& [name, s] : stats_) {
            (void)name;
            out.push_back(s);
        }
    }
    std::sort(out.begin(), out.end(),
        [](const StageStats& a, const StageStats& b) { return a.name < b.name; });
    return out;
}

// ═══════════════════════════════════════════════
// Report
// ═══════════════════════════════════════════════
void StageProfiler::print_report(std::ostream& out) const {
    const auto sorted = all_stats();

    out << "\n╔══════════════════════════════════════════════════════════════════╗\n";
    out << "║                       STAGE TIMINGS                             ║\n";
    out << "╠══════════════════════════════════════════════════════════════════╣\n";
    out << "║ " << std::left << std::setw(28) << "Stage"
        << std::right << std::setw(8) << "Calls"
        << std::setw(10) << "Last ms"
        << std::setw(10) << "Max ms"
        << std::setw(10) << "Avg ms"
        << " ║\n";
    out << "╠══════════════════════════════════════════════════════════════════╣\n";

    for (const auto& s : sorted) {
        out << "║ " << std::left << std::setw(28) << s.name
            << std::right << std::setw(8) << s.call_count
            << std::fixed << std::setprecision(3)
            << std::setw(10) << s.last_ms
            << std::setw(10) << s.max_ms
            << std::setw(10) << s.avg_ms()
            << " ║\n";
    }

    out << "╚══════════════════════════════════════════════════════════════════╝\n\n";
}

} // namespace impactflow
