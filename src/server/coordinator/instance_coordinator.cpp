// SPDX-License-Identifier: Apache-2.0
#include "server/coordinator/instance_coordinator.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <system_error>

namespace arena::coord {

using namespace std::chrono_literals;

InstanceCoordinator::InstanceCoordinator(
    std::shared_ptr<coro::io_scheduler> scheduler,
    CoordinatorOptions options,
    EngineFactory engine_factory,
    results::ResultAggregator &aggregator)
    : m_scheduler(std::move(scheduler)), m_options(std::move(options)), m_engine_factory(std::move(engine_factory)),
      m_aggregator(aggregator), m_ports(m_options.port_begin, m_options.port_end, m_options.probe_ports)
{
    auto started_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
    static std::atomic<uint32_t> instances{0};
    m_instance_tag = std::to_string(::getpid()) + "_" + std::to_string(started_ms) + "_"
        + std::to_string(instances.fetch_add(1, std::memory_order_relaxed));
}

std::filesystem::path InstanceCoordinator::session_workdir(uint64_t session_id) const
{
    return m_options.work_root / (m_instance_tag + "_session_" + std::to_string(session_id));
}

void InstanceCoordinator::update_gauges_locked()
{
    auto &rt = metrics::runtime();
    rt.active_sessions.store(m_admitted.size(), std::memory_order_relaxed);
    size_t queued = m_sessions.size() > m_admitted.size() ? m_sessions.size() - m_admitted.size() : 0;
    rt.queued_sessions.store(queued, std::memory_order_relaxed);
}

SubmitResult InstanceCoordinator::submit(const arena::StartMatch &req, EventSink sink)
{
    SubmitResult res;
    if (auto err = game::validate(req)) {
        res.reason = "invalid match config: " + *err;
        metrics::inc(metrics::runtime().sessions_rejected);
        log::warn("[coord] rejected match={}: {}", req.match_id(), res.reason);
        return res;
    }
    std::shared_ptr<game::MatchSession> session;
    uint16_t port = 0;
    {
        std::scoped_lock lk{m_mutex};
        size_t pending = m_sessions.size() - m_admitted.size();
        if (pending >= m_options.queue_soft_limit) {
            res.reason = "queue full";
        } else if (auto p = m_ports.allocate()) {
            port = *p;
        } else {
            res.reason = "no free engine port";
        }
        if (!res.reason.empty()) {
            metrics::inc(metrics::runtime().sessions_rejected);
            log::warn("[coord] rejected match={}: {}", req.match_id(), res.reason);
            return res;
        }
        uint64_t id = ++m_next_id;
        auto sopts = m_options.session;
        sopts.port = port;
        sopts.workdir = session_workdir(id);
        session = std::make_shared<game::MatchSession>(
            id, game::resolve(req, m_options.defaults), std::move(sopts), m_scheduler, m_engine_factory());
        m_sessions.emplace(id, Entry{session, port, sink});
        update_gauges_locked();
        res.accepted = true;
        res.session_id = id;
        // Accepted goes out before a bot can attach and emit BotConnected.
        arena::SupervisorEvent ev;
        ev.mutable_accepted()->set_session_id(id);
        ev.mutable_accepted()->set_queue_position(static_cast<uint32_t>(pending));
        if (sink)
            sink(ev);
    }
    log::info("[coord] session {} registered match={} port={}", res.session_id, req.match_id(), port);
    m_scheduler->spawn(run_session(std::move(session), port, std::move(sink)));
    return res;
}

bool InstanceCoordinator::can_attach(const std::string &player_id) const
{
    std::scoped_lock lk{m_mutex};
    return std::any_of(
        m_sessions.begin(), m_sessions.end(), [&](const auto &kv) { return kv.second.session->awaits(player_id); });
}

AttachResult InstanceCoordinator::attach_bot(const std::string &player_id, std::unique_ptr<net::Channel> &channel)
{
    AttachResult res;
    EventSink sink;
    {
        std::scoped_lock lk{m_mutex};
        for (auto &[id, entry] : m_sessions) {
            if (!entry.session->awaits(player_id))
                continue;
            uint32_t slot = 0;
            if (entry.session->attach(player_id, channel, slot) == game::attach_status::attached) {
                res.attached = true;
                res.session_id = id;
                res.slot = slot;
                sink = entry.sink;
                break;
            }
        }
    }
    if (res.attached && sink) {
        arena::SupervisorEvent ev;
        auto *bc = ev.mutable_bot_connected();
        bc->set_session_id(res.session_id);
        bc->set_player_id(player_id);
        bc->set_slot(res.slot);
        sink(ev);
    }
    return res;
}

bool InstanceCoordinator::abort(uint64_t session_id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_sessions.find(session_id);
    if (it == m_sessions.end())
        return false;
    log::info("[coord] abort requested for session {}", session_id);
    it->second.session->request_abort();
    return true;
}

void InstanceCoordinator::abort_all()
{
    std::scoped_lock lk{m_mutex};
    for (auto &[id, entry] : m_sessions)
        entry.session->request_abort();
}

coro::task<bool> InstanceCoordinator::acquire(uint64_t session_id, const std::atomic<bool> &abort)
{
    {
        std::scoped_lock lk{m_mutex};
        // Request order, not bot arrival order: ids grow with each submit.
        m_admission.insert(std::upper_bound(m_admission.begin(), m_admission.end(), session_id), session_id);
    }
    bool logged = false;
    while (true) {
        {
            std::scoped_lock lk{m_mutex};
            if (abort.load(std::memory_order_acquire)) {
                m_admission.erase(std::find(m_admission.begin(), m_admission.end(), session_id));
                update_gauges_locked();
                co_return false;
            }
            if (m_admission.front() == session_id && m_admitted.size() < m_options.max_parallel) {
                m_admission.pop_front();
                m_admitted.insert(session_id);
                update_gauges_locked();
                log::debug("[coord] session {} admitted running={}", session_id, m_admitted.size());
                co_return true;
            }
            if (!logged) {
                logged = true;
                log::info(
                    "[coord] session {} waiting for a run slot (running={} max={})",
                    session_id,
                    m_admitted.size(),
                    m_options.max_parallel);
            }
        }
        co_await m_scheduler->yield_for(10ms);
    }
}

void InstanceCoordinator::release(uint64_t session_id)
{
    std::scoped_lock lk{m_mutex};
    m_admitted.erase(session_id);
    update_gauges_locked();
}

namespace {

// Drops the session directory unless the replay had to fall back into it.
void remove_workdir(const std::filesystem::path &workdir, const game::MatchResult &result)
{
    if (workdir.empty())
        return;
    if (!result.replay_path.empty()) {
        auto rel = std::filesystem::path(result.replay_path).lexically_relative(workdir);
        if (!rel.empty() && *rel.begin() != "..") {
            log::info("[coord] keeping {} (holds the replay)", workdir.string());
            return;
        }
    }
    std::error_code ec;
    std::filesystem::remove_all(workdir, ec);
    if (ec)
        log::warn("[coord] cannot remove {}: {}", workdir.string(), ec.message());
}

} // namespace

coro::task<void> InstanceCoordinator::run_session(
    std::shared_ptr<game::MatchSession> session, uint16_t port, EventSink sink)
{
    co_await m_scheduler->schedule();
    auto outcome = co_await session->run(this);
    game::MatchResult result = outcome.result;
    auto workdir = outcome.workdir;
    try {
        result = m_aggregator.finalize(std::move(outcome));
    } catch (const std::exception &ex) {
        log::error("[coord] session {} result persistence threw: {}", session->id(), ex.what());
        metrics::inc(metrics::runtime().result_persist_failures);
    }
    remove_workdir(workdir, result);
    {
        std::scoped_lock lk{m_mutex};
        m_sessions.erase(session->id());
        m_admitted.erase(session->id());
        update_gauges_locked();
    }
    m_ports.release(port);
    if (sink) {
        arena::SupervisorEvent ev;
        *ev.mutable_result() = game::to_report(result);
        sink(ev);
    }
}

size_t InstanceCoordinator::registered() const
{
    std::scoped_lock lk{m_mutex};
    return m_sessions.size();
}

size_t InstanceCoordinator::running() const
{
    std::scoped_lock lk{m_mutex};
    return m_admitted.size();
}

size_t InstanceCoordinator::waiting() const
{
    std::scoped_lock lk{m_mutex};
    return m_admission.size();
}

coro::task<void> InstanceCoordinator::drain()
{
    while (registered() > 0)
        co_await m_scheduler->yield_for(20ms);
}

} // namespace arena::coord
