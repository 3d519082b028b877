// SPDX-License-Identifier: Apache-2.0
#include "server/game/step_scheduler.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <tuple>

namespace arena::game {

StrikeLedger::StrikeLedger(std::chrono::milliseconds budget, uint32_t limit)
    : m_budget(budget), m_limit(limit == 0 ? 1 : limit)
{}

bool StrikeLedger::record_miss(uint32_t slot, std::chrono::nanoseconds waited)
{
    m_pending[slot] += waited;
    if (m_pending[slot] < m_budget)
        return false;
    m_pending[slot] = std::chrono::nanoseconds::zero();
    ++m_strikes[slot];
    return true;
}

void StrikeLedger::record_response(uint32_t slot)
{
    m_pending[slot] = std::chrono::nanoseconds::zero();
}

std::optional<Verdict> verdict_from_report(const arena::ResponseStep &step)
{
    if (step.player_result_size() == 0)
        return std::nullopt;
    std::array<arena::PlayerOutcome, 2> res{arena::PLAYER_OUTCOME_UNDECIDED, arena::PLAYER_OUTCOME_UNDECIDED};
    for (const auto &pr : step.player_result()) {
        if (pr.player_id() == 1 || pr.player_id() == 2)
            res[pr.player_id() - 1] = pr.result();
    }
    Verdict v{outcome::tie, end_reason::engine_report, std::nullopt};
    if (res[0] == arena::PLAYER_OUTCOME_VICTORY && res[1] != arena::PLAYER_OUTCOME_VICTORY) {
        v.result = outcome::player1_win;
        v.loser_slot = 1;
    } else if (res[1] == arena::PLAYER_OUTCOME_VICTORY && res[0] != arena::PLAYER_OUTCOME_VICTORY) {
        v.result = outcome::player2_win;
        v.loser_slot = 0;
    } else if (res[0] == arena::PLAYER_OUTCOME_DEFEAT && res[1] != arena::PLAYER_OUTCOME_DEFEAT) {
        v.result = outcome::player2_win;
        v.loser_slot = 0;
    } else if (res[1] == arena::PLAYER_OUTCOME_DEFEAT && res[0] != arena::PLAYER_OUTCOME_DEFEAT) {
        v.result = outcome::player1_win;
        v.loser_slot = 1;
    }
    return v;
}

namespace {

// One-sided conditions forfeit that bot; two-sided ones use both_outcome.
std::optional<Verdict> pairwise(std::array<bool, 2> hit, outcome both_outcome, end_reason reason)
{
    if (hit[0] && hit[1])
        return Verdict{both_outcome, reason, std::nullopt};
    for (uint32_t slot = 0; slot < 2; ++slot) {
        if (hit[slot])
            return Verdict{opponent_wins(slot), reason, slot};
    }
    return std::nullopt;
}

} // namespace

std::optional<Verdict> decide(const StepObservation &obs)
{
    if (obs.aborted)
        return Verdict{outcome::error, end_reason::aborted, std::nullopt};
    bool engine_gone = !obs.engine_alive || obs.engine_lost[0] || obs.engine_lost[1]
        || obs.status[0] == exchange_status::engine_closed || obs.status[1] == exchange_status::engine_closed;
    if (engine_gone)
        return Verdict{outcome::crash, end_reason::engine_crash, std::nullopt};
    auto is = [&](exchange_status s) {
        return std::array<bool, 2>{obs.status[0] == s, obs.status[1] == s};
    };
    if (auto v = pairwise(is(exchange_status::bot_disconnected), outcome::error, end_reason::disconnect))
        return v;
    if (auto v = pairwise(is(exchange_status::surrendered), outcome::tie, end_reason::surrender))
        return v;
    if (auto v = pairwise(obs.strikes_exhausted, outcome::tie, end_reason::double_timeout)) {
        if (v->loser_slot)
            v->reason = end_reason::timeout_limit_exceeded;
        return v;
    }
    if (auto v = pairwise(obs.decode_exceeded, outcome::error, end_reason::protocol_decode_error))
        return v;
    if (obs.report) {
        if (auto v = verdict_from_report(*obs.report))
            return v;
    }
    if (obs.step >= obs.max_steps)
        return Verdict{outcome::tie, end_reason::max_duration, std::nullopt};
    return std::nullopt;
}

uint32_t advance_game_loop(uint32_t previous, const std::array<ExchangeResult, 2> &ex)
{
    std::optional<uint32_t> reported;
    uint32_t requested = 1;
    for (const auto &r : ex) {
        requested = std::max(requested, r.step_count);
        if (r.step)
            reported = std::max(reported.value_or(0), r.step->game_loop());
    }
    if (reported)
        return std::max(previous, *reported);
    return previous + requested;
}

StepScheduler::StepScheduler(
    std::shared_ptr<coro::io_scheduler> scheduler,
    SchedulerOptions options,
    ProtocolBridge &bridge0,
    ProtocolBridge &bridge1,
    engine::Engine &engine,
    const std::atomic<bool> &abort)
    : m_scheduler(std::move(scheduler)), m_options(options), m_bridges{&bridge0, &bridge1}, m_engine(engine),
      m_abort(abort), m_strikes(options.max_frame_time, options.strike_limit)
{}

std::chrono::milliseconds StepScheduler::window() const
{
    if (m_options.real_time)
        return std::min(m_options.max_frame_time, m_options.cadence);
    return m_options.max_frame_time;
}

double StepScheduler::avg_frame_ms(uint32_t slot) const
{
    uint32_t n = rounds();
    if (n == 0)
        return 0.0;
    return std::chrono::duration<double, std::milli>(m_think_time[slot]).count() / static_cast<double>(n);
}

coro::task<Verdict> StepScheduler::run()
{
    using clock = std::chrono::steady_clock;
    co_await m_scheduler->schedule();
    auto next_tick = clock::now();
    while (true) {
        if (m_abort.load(std::memory_order_acquire))
            co_return Verdict{outcome::error, end_reason::aborted, std::nullopt};
        uint32_t round = m_rounds.fetch_add(1, std::memory_order_relaxed) + 1;
        auto started = clock::now();
        auto budget = window();

        // Both exchanges in flight together so one slow bot does not eat the other's budget.
        auto results =
            co_await coro::when_all(m_bridges[0]->run_step(budget, m_abort), m_bridges[1]->run_step(budget, m_abort));
        std::array<ExchangeResult, 2> ex{
            std::move(std::get<0>(results).return_value()), std::move(std::get<1>(results).return_value())};
        auto step_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - started).count();
        metrics::add_step_duration(static_cast<uint64_t>(step_ns));
        uint32_t step_no = advance_game_loop(m_game_loop.load(std::memory_order_relaxed), ex);
        m_game_loop.store(step_no, std::memory_order_relaxed);

        StepObservation obs;
        obs.step = step_no;
        obs.max_steps = m_options.max_steps;
        for (uint32_t slot = 0; slot < 2; ++slot) {
            const auto &r = ex[slot];
            m_think_time[slot] += r.bot_time;
            obs.status[slot] = r.status;
            obs.engine_lost[slot] = r.engine_lost;
            if (r.status == exchange_status::timed_out) {
                if (m_strikes.record_miss(slot, r.bot_time)) {
                    metrics::inc(metrics::runtime().strikes_total);
                    log::warn(
                        "[steps] slot={} missed round {} (step {}) budget={}ms strikes={}/{}",
                        slot,
                        round,
                        step_no,
                        budget.count(),
                        m_strikes.strikes(slot),
                        m_strikes.limit());
                }
            } else if (r.status == exchange_status::stepped) {
                m_strikes.record_response(slot);
            } else if (r.status == exchange_status::decode_error) {
                ++m_decode_errors[slot];
            }
            obs.strikes_exhausted[slot] = m_strikes.exhausted(slot);
            obs.decode_exceeded[slot] = m_decode_errors[slot] > m_options.decode_error_tolerance;
            if (!obs.report && r.step && r.step->player_result_size() > 0)
                obs.report = *r.step;
        }
        obs.engine_alive = m_engine.is_alive();
        obs.aborted = m_abort.load(std::memory_order_acquire);

        if (auto v = decide(obs)) {
            log::info(
                "[steps] finished at step {} after {} rounds: {} ({}) exchanges={}/{}",
                step_no,
                round,
                to_string(v->result),
                to_string(v->reason),
                to_string(ex[0].status),
                to_string(ex[1].status));
            co_return *v;
        }
        ARENA_LOG_EVERY_N(debug, 1000, "[steps] step={} p99_ns={}", step_no, metrics::approx_step_p99());

        if (m_options.real_time) {
            next_tick += m_options.cadence;
            auto now = clock::now();
            if (next_tick > now)
                co_await m_scheduler->yield_for(std::chrono::duration_cast<std::chrono::milliseconds>(next_tick - now));
            else
                next_tick = now; // overran the cadence, do not burst to catch up
        }
    }
}

} // namespace arena::game
