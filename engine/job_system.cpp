#include "engine/job_system.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <thread>
#include <vector>

namespace impactflow {

JobSystem::JobSystem(unsigned thread_count) {
    set_thread_count(thread_count);
}

void JobSystem::set_thread_count(unsigned count) {
    if (count == 0) count = std::thread::hardware_concurrency();
    thread_count_ = std::max(1u, count);
}

// ═══════════════════════════════════════════════
// Parallel For
// ═══════════════════════════════════════════════
void JobSystem::parallel_for(size_t count, const std::function<void(size_t)>& func) const {
    if (count == 0) return;

    const size_t workers = std::min<size_t>(thread_count_, count);
    if (workers <= 1) {
        for (size_t i = 0; i < count; ++i) func(i);
        return;
    }

    std::atomic<size_t> next{0};
    std::vector<std::future<void>> futures;
    futures.reserve(workers);

    for (size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, [&func, &next, count]() {
            for (size_t i = next.fetch_add(1, std::memory_order_relaxed); i < count;
                 i = next.fetch_add(1, std::memory_order_relaxed)) {
                func(i);
            }
        }));
    }

    // Wait for every worker before rethrowing so no task outlives this call.
    for (auto& f : futures) f.wait();
    for (auto& f : futures) f.get();
}

} // namespace impactflow
