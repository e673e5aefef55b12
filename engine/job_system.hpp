#pragma once

#include <cstddef>
#include <functional>

namespace impactflow {

/// Fixed-size worker pool for independent per-symbol and per-unit tasks.
///
/// parallel_for hands indices [0, count) to at most thread_count() workers and
/// returns only once all of them have finished, which makes each call a join
/// barrier. Tasks must only write state owned by their own index.
class JobSystem {
public:
    /// 0 selects std::thread::hardware_concurrency().
    explicit JobSystem(unsigned thread_count = 0);

    void set_thread_count(unsigned count);
    unsigned thread_count() const { return thread_count_; }

    void parallel_for(size_t count, const std::function<void(size_t index)>& func) const;

private:
    unsigned thread_count_{1};
};

} // namespace impactflow
