// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/engine/engine.hpp"
#include "server/game/match_result.hpp"
#include "server/game/protocol_bridge.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace arena::game {

// Per-bot time-budget violations. A bot's waiting time accumulates across
// consecutive missed windows; each full budget of waiting is one strike.
// With window == budget (stepped mode) every miss is a strike. Counters never
// decrease.
class StrikeLedger
{
public:
    StrikeLedger(std::chrono::milliseconds budget, uint32_t limit);

    // Returns true when this miss added a strike.
    bool record_miss(uint32_t slot, std::chrono::nanoseconds waited);
    void record_response(uint32_t slot);

    uint32_t strikes(uint32_t slot) const { return m_strikes[slot]; }
    bool exhausted(uint32_t slot) const { return m_strikes[slot] >= m_limit; }
    uint32_t limit() const { return m_limit; }

private:
    std::chrono::nanoseconds m_budget;
    uint32_t m_limit;
    std::array<uint32_t, 2> m_strikes{};
    std::array<std::chrono::nanoseconds, 2> m_pending{};
};

struct SchedulerOptions
{
    uint32_t max_steps{60486};
    std::chrono::milliseconds max_frame_time{1000};
    uint32_t strike_limit{10};
    bool real_time{false};
    std::chrono::milliseconds cadence{45};
    uint32_t decode_error_tolerance{3};
};

struct Verdict
{
    outcome result{outcome::error};
    end_reason reason{end_reason::internal_error};
    std::optional<uint32_t> loser_slot;
};

// Everything the end-of-step decision looks at. step is the engine's game
// loop after the exchange, not the number of exchanges.
struct StepObservation
{
    uint32_t step{0};
    uint32_t max_steps{0};
    bool aborted{false};
    bool engine_alive{true};
    std::array<exchange_status, 2> status{exchange_status::stepped, exchange_status::stepped};
    std::array<bool, 2> engine_lost{};
    std::array<bool, 2> strikes_exhausted{};
    std::array<bool, 2> decode_exceeded{};
    std::optional<arena::ResponseStep> report;
};

// Ordered end-of-step rules: abort, engine loss, disconnect, surrender,
// strikes, decode errors, engine game-over report, step limit.
std::optional<Verdict> decide(const StepObservation &obs);

// Outcome of an engine game-over report, nullopt when the report carries no result.
std::optional<Verdict> verdict_from_report(const arena::ResponseStep &step);

// Engine game loop after one exchange round: the highest game_loop reported
// by the step replies, or previous + requested steps when no reply carried
// one (engine lost mid-step). Never goes backwards.
uint32_t advance_game_loop(uint32_t previous, const std::array<ExchangeResult, 2> &ex);

// Drives both bridges one exchange at a time until a verdict is reached.
class StepScheduler
{
public:
    StepScheduler(
        std::shared_ptr<coro::io_scheduler> scheduler,
        SchedulerOptions options,
        ProtocolBridge &bridge0,
        ProtocolBridge &bridge1,
        engine::Engine &engine,
        const std::atomic<bool> &abort);

    coro::task<Verdict> run();

    // Engine game loop reached so far.
    uint32_t step() const { return m_game_loop.load(std::memory_order_relaxed); }
    // Exchange rounds played (one step request per bot each).
    uint32_t rounds() const { return m_rounds.load(std::memory_order_relaxed); }
    const StrikeLedger &strikes() const { return m_strikes; }
    uint32_t decode_errors(uint32_t slot) const { return m_decode_errors[slot]; }
    double avg_frame_ms(uint32_t slot) const;

private:
    std::chrono::milliseconds window() const;

    std::shared_ptr<coro::io_scheduler> m_scheduler;
    SchedulerOptions m_options;
    std::array<ProtocolBridge *, 2> m_bridges;
    engine::Engine &m_engine;
    const std::atomic<bool> &m_abort;
    StrikeLedger m_strikes;
    std::atomic<uint32_t> m_game_loop{0};
    std::atomic<uint32_t> m_rounds{0};
    std::array<uint32_t, 2> m_decode_errors{};
    std::array<std::chrono::nanoseconds, 2> m_think_time{};
};

} // namespace arena::game
