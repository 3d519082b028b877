// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide counters for the match proxy (atomics, no dynamic allocation).
#pragma once
#include <atomic>
#include <cstdint>

namespace arena::metrics {

struct RuntimeCounters
{
    // Session lifecycle gauges / counters
    std::atomic<uint64_t> active_sessions{0}; // admitted: launching, in progress, ending
    std::atomic<uint64_t> queued_sessions{0}; // registered, not yet admitted
    std::atomic<uint64_t> sessions_started{0};
    std::atomic<uint64_t> sessions_completed{0};
    std::atomic<uint64_t> sessions_failed{0};
    std::atomic<uint64_t> sessions_rejected{0};
    // Gateway
    std::atomic<uint64_t> connections_accepted{0};
    std::atomic<uint64_t> handshakes_rejected{0};
    // Fairness enforcement
    std::atomic<uint64_t> strikes_total{0};
    std::atomic<uint64_t> decode_errors_total{0};
    std::atomic<uint64_t> debug_frames_blocked{0};
    std::atomic<uint64_t> frames_relayed{0};
    std::atomic<uint64_t> bot_disconnects{0};
    // Engine
    std::atomic<uint64_t> engine_launch_failures{0};
    std::atomic<uint64_t> engine_crashes{0};
    std::atomic<uint64_t> engine_forced_kills{0};
    // Results
    std::atomic<uint64_t> result_persist_failures{0};
    // Step duration (both bot exchanges of one step). Power-of-two buckets from 1ms -> up to ~2s.
    static constexpr int STEP_BUCKETS = 12;
    static constexpr uint64_t step_bucket_base_ns = 1'000'000ULL;
    std::atomic<uint64_t> step_hist[STEP_BUCKETS]{};
    std::atomic<uint64_t> step_duration_ns_accum{0};
    std::atomic<uint64_t> step_samples{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void inc(std::atomic<uint64_t> &c, uint64_t n = 1)
{
    c.fetch_add(n, std::memory_order_relaxed);
}

// Saturating decrement for gauges.
inline void dec(std::atomic<uint64_t> &c)
{
    uint64_t cur = c.load(std::memory_order_relaxed);
    while (cur > 0 && !c.compare_exchange_weak(cur, cur - 1, std::memory_order_relaxed)) {
    }
}

inline void add_step_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.step_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.step_samples.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < RuntimeCounters::STEP_BUCKETS; ++i) {
        if (ns < (RuntimeCounters::step_bucket_base_ns << i)) {
            rt.step_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.step_hist[RuntimeCounters::STEP_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t approx_step_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.step_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::STEP_BUCKETS; ++i) {
        cumulative += rt.step_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return RuntimeCounters::step_bucket_base_ns << i;
    }
    return RuntimeCounters::step_bucket_base_ns << (RuntimeCounters::STEP_BUCKETS - 1);
}

inline uint64_t avg_step_ns()
{
    auto &rt = runtime();
    uint64_t samples = rt.step_samples.load(std::memory_order_relaxed);
    return samples ? rt.step_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
}

} // namespace arena::metrics
