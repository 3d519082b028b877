// SPDX-License-Identifier: Apache-2.0
#include "server/game/match_session.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/protocol_bridge.hpp"

#include <system_error>

namespace arena::game {

using namespace std::chrono_literals;

const char *to_string(session_state s)
{
    switch (s) {
        case session_state::idle:
            return "idle";
        case session_state::awaiting_players:
            return "awaiting_players";
        case session_state::launching:
            return "launching";
        case session_state::in_progress:
            return "in_progress";
        case session_state::ending:
            return "ending";
        case session_state::closed:
            return "closed";
        case session_state::failed:
            return "failed";
    }
    return "unknown";
}

MatchSession::MatchSession(
    uint64_t id,
    MatchConfig config,
    SessionOptions options,
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::unique_ptr<engine::Engine> engine)
    : m_id(id), m_config(std::move(config)), m_options(std::move(options)), m_scheduler(std::move(scheduler)),
      m_engine(std::move(engine))
{}

void MatchSession::set_state(session_state s)
{
    auto prev = m_state.exchange(s, std::memory_order_acq_rel);
    log::debug("[session] id={} {} -> {}", m_id, to_string(prev), to_string(s));
}

bool MatchSession::awaits(const std::string &player_id) const
{
    auto st = state();
    if (st != session_state::idle && st != session_state::awaiting_players)
        return false;
    auto slot = m_config.slot_of(player_id);
    if (!slot)
        return false;
    std::scoped_lock lk{m_mutex};
    return m_bots[*slot] == nullptr;
}

attach_status MatchSession::attach(
    const std::string &player_id, std::unique_ptr<net::Channel> &channel, uint32_t &slot)
{
    auto cfg_slot = m_config.slot_of(player_id);
    if (!cfg_slot)
        return attach_status::unknown_player;
    std::scoped_lock lk{m_mutex};
    auto st = state();
    if (st != session_state::idle && st != session_state::awaiting_players)
        return attach_status::not_accepting;
    if (m_bots[*cfg_slot])
        return attach_status::slot_taken;
    m_bots[*cfg_slot] = std::move(channel);
    slot = *cfg_slot;
    log::info("[session] id={} player={} attached to slot {}", m_id, player_id, slot);
    return attach_status::attached;
}

coro::task<std::optional<Verdict>> MatchSession::await_players()
{
    auto deadline = std::chrono::steady_clock::now() + m_options.player_connect_timeout;
    while (true) {
        std::array<bool, 2> present{};
        {
            std::scoped_lock lk{m_mutex};
            present = {m_bots[0] != nullptr, m_bots[1] != nullptr};
        }
        if (present[0] && present[1])
            co_return std::nullopt;
        if (abort_requested())
            co_return Verdict{outcome::error, end_reason::aborted, std::nullopt};
        if (std::chrono::steady_clock::now() >= deadline) {
            std::optional<uint32_t> missing;
            if (present[0] != present[1])
                missing = present[0] ? 1u : 0u;
            log::warn(
                "[session] id={} players not connected within {}ms (slot0={} slot1={})",
                m_id,
                m_options.player_connect_timeout.count(),
                present[0],
                present[1]);
            co_return Verdict{outcome::error, end_reason::player_connect_timeout, missing};
        }
        co_await m_scheduler->yield_for(20ms);
    }
}

coro::task<std::optional<arena::Response>> MatchSession::engine_call(uint32_t slot, const arena::Request &req)
{
    std::string payload;
    req.SerializeToString(&payload);
    if (!co_await m_engine->send_frame(slot, std::move(payload)))
        co_return std::nullopt;
    auto rr = co_await m_engine->recv_frame(slot, m_options.engine_response_timeout);
    arena::Response resp;
    if (rr.status != net::recv_status::frame || !resp.ParseFromString(rr.payload))
        co_return std::nullopt;
    co_return resp;
}

coro::task<std::optional<Verdict>> MatchSession::launch()
{
    const Verdict launch_failed{outcome::error, end_reason::engine_launch_failed, std::nullopt};
    std::error_code ec;
    std::filesystem::create_directories(m_options.workdir, ec);
    if (ec) {
        log::error("[session] id={} cannot create workdir {}: {}", m_id, m_options.workdir.string(), ec.message());
        co_return launch_failed;
    }
    engine::EngineLaunch params{m_options.port, m_options.workdir, m_config.map, m_config.players};
    bool started = co_await m_engine->start(params);
    m_engine_started = true; // terminate() is safe either way
    if (!started) {
        metrics::inc(metrics::runtime().engine_launch_failures);
        log::error("[session] id={} engine launch failed: {}", m_id, m_engine->last_error());
        co_return launch_failed;
    }

    arena::Request create;
    create.set_id(1);
    auto *cg = create.mutable_create_game();
    cg->set_map(m_config.map);
    cg->set_realtime(m_config.real_time);
    cg->set_player_count(2);
    auto created = co_await engine_call(0, create);
    if (!created || created->error_size() > 0 || !created->has_create_game()) {
        log::error(
            "[session] id={} create_game rejected map={} error={}",
            m_id,
            m_config.map,
            created && created->error_size() > 0 ? created->error(0) : std::string("no reply"));
        co_return launch_failed;
    }
    for (uint32_t slot = 0; slot < 2; ++slot) {
        arena::Request join;
        join.set_id(2);
        join.mutable_join_game()->set_slot(slot);
        join.mutable_join_game()->set_player_name(m_config.players[slot]);
        auto joined = co_await engine_call(slot, join);
        if (!joined || joined->error_size() > 0 || !joined->has_join_game()) {
            log::error("[session] id={} join_game failed for slot {}", m_id, slot);
            co_return launch_failed;
        }
    }
    for (uint32_t slot = 0; slot < 2; ++slot) {
        arena::Response ready;
        ready.set_id(0);
        ready.set_status(arena::STATUS_IN_GAME);
        ready.mutable_join_game()->set_player_id(slot + 1);
        std::string payload;
        ready.SerializeToString(&payload);
        if (!co_await m_bots[slot]->send_frame(std::move(payload))) {
            metrics::inc(metrics::runtime().bot_disconnects);
            log::warn("[session] id={} slot {} gone before game start", m_id, slot);
            co_return Verdict{opponent_wins(slot), end_reason::disconnect, slot};
        }
    }
    co_return std::nullopt;
}

coro::task<Verdict> MatchSession::play()
{
    BridgeOptions bo;
    bo.disable_debug = m_config.disable_debug;
    bo.engine_timeout = m_options.engine_response_timeout;
    for (uint32_t slot = 0; slot < 2; ++slot)
        m_bridges[slot] = std::make_unique<ProtocolBridge>(slot, *m_bots[slot], *m_engine, bo);

    SchedulerOptions so;
    so.max_steps = m_config.max_game_steps;
    so.max_frame_time = m_config.max_frame_time;
    so.strike_limit = m_config.strikes;
    so.real_time = m_config.real_time;
    so.cadence = m_options.real_time_step;
    so.decode_error_tolerance = m_options.decode_error_tolerance;
    m_steps = std::make_unique<StepScheduler>(m_scheduler, so, *m_bridges[0], *m_bridges[1], *m_engine, m_abort);
    auto verdict = co_await m_steps->run();
    if (verdict.reason == end_reason::engine_crash)
        metrics::inc(metrics::runtime().engine_crashes);
    if (verdict.reason == end_reason::disconnect)
        metrics::inc(metrics::runtime().bot_disconnects);
    co_return verdict;
}

coro::task<std::optional<std::string>> MatchSession::fetch_replay()
{
    arena::Request req;
    req.set_id(3);
    req.mutable_save_replay();
    auto resp = co_await engine_call(0, req);
    if (!resp || !resp->has_save_replay() || resp->save_replay().data().empty()) {
        log::warn("[session] id={} engine produced no replay", m_id);
        co_return std::nullopt;
    }
    co_return resp->save_replay().data();
}

coro::task<void> MatchSession::shutdown_engine()
{
    if (m_engine && m_engine_started)
        co_await m_engine->terminate(m_options.shutdown_grace);
}

void MatchSession::finish(const Verdict &v)
{
    if (m_result) {
        log::warn("[session] id={} second verdict {} ignored", m_id, to_string(v.reason));
        return;
    }
    MatchResult r;
    r.session_id = m_id;
    r.match_id = m_config.match_id;
    r.result = v.result;
    r.reason = v.reason;
    r.loser_slot = v.loser_slot;
    for (uint32_t slot = 0; slot < 2; ++slot) {
        r.bots[slot].player_id = m_config.players[slot];
        if (m_steps) {
            r.bots[slot].strikes = m_steps->strikes().strikes(slot);
            r.bots[slot].avg_frame_ms = m_steps->avg_frame_ms(slot);
            r.bots[slot].decode_errors = m_steps->decode_errors(slot);
        }
    }
    r.final_step = m_steps ? m_steps->step() : 0;
    m_result = std::move(r);
}

coro::task<SessionOutcome> MatchSession::run(AdmissionGate *gate)
{
    co_await m_scheduler->schedule();
    m_started = std::chrono::steady_clock::now();
    metrics::inc(metrics::runtime().sessions_started);
    set_state(session_state::awaiting_players);
    log::info(
        "[session] id={} match={} map={} {} vs {} steps={} frame={}ms strikes={} realtime={}",
        m_id,
        m_config.match_id,
        m_config.map,
        m_config.players[0],
        m_config.players[1],
        m_config.max_game_steps,
        m_config.max_frame_time.count(),
        m_config.strikes,
        m_config.real_time);

    bool admitted = false;
    bool played = false;
    try {
        if (auto v = co_await await_players()) {
            finish(*v);
        } else if (gate && !co_await gate->acquire(m_id, m_abort)) {
            finish(Verdict{outcome::error, end_reason::aborted, std::nullopt});
        } else {
            admitted = gate != nullptr;
            set_state(session_state::launching);
            if (auto v = co_await launch()) {
                finish(*v);
            } else {
                set_state(session_state::in_progress);
                played = true;
                finish(co_await play());
            }
        }
    } catch (const std::exception &ex) {
        log::error("[session] id={} internal error: {}", m_id, ex.what());
        finish(Verdict{outcome::error, end_reason::internal_error, std::nullopt});
    }

    set_state(session_state::ending);
    SessionOutcome out;
    out.requested_replay = m_config.replay_path;
    out.workdir = m_options.workdir;
    try {
        if (played && !m_config.replay_path.empty() && m_engine->is_alive())
            out.replay_data = co_await fetch_replay();
    } catch (const std::exception &ex) {
        log::warn("[session] id={} replay fetch failed: {}", m_id, ex.what());
    }
    co_await shutdown_engine();
    {
        std::scoped_lock lk{m_mutex};
        for (auto &bot : m_bots) {
            if (bot)
                bot->close();
        }
    }
    if (admitted)
        gate->release(m_id);

    out.result = *m_result;
    out.result.elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - m_started);
    set_state(played ? session_state::closed : session_state::failed);
    log::info(
        "[session] id={} result={} reason={} loser={} step={} elapsed={}ms",
        m_id,
        to_string(out.result.result),
        to_string(out.result.reason),
        out.result.loser().empty() ? std::string("-") : out.result.loser(),
        out.result.final_step,
        out.result.elapsed.count());
    co_return out;
}

} // namespace arena::game
