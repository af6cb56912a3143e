// filename: core/metrics.hpp
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

// Per-run counters, bumped by coordinator tasks as they finish.
struct Metrics {
    std::atomic<uint64_t> produced{0};
    std::atomic<uint64_t> consumed{0};
    std::atomic<uint64_t> failed_tasks{0};
};

// monotonic, for elapsed times only
inline uint64_t now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}
