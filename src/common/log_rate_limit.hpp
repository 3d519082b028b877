// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite rate-limited logging: emits every Nth invocation.
// Sessions run on the scheduler thread pool, so the counter is atomic.
// Usage: ARENA_LOG_EVERY_N(debug, 500, "[steps] session={} step={}", id, step);
#define ARENA_LOG_EVERY_N(level, N, ...) \
    do { \
        static std::atomic<uint64_t> _arena_log_counter_##__LINE__{0}; \
        if ((_arena_log_counter_##__LINE__.fetch_add(1, std::memory_order_relaxed) + 1) % (N) == 0) { \
            arena::log::level(__VA_ARGS__); \
        } \
    } while (0)
