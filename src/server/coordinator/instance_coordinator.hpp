// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "arena.pb.h"
#include "server/engine/engine.hpp"
#include "server/engine/port_allocator.hpp"
#include "server/game/match_config.hpp"
#include "server/game/match_session.hpp"
#include "server/net/channel.hpp"
#include "server/results/result_aggregator.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace arena::coord {

using EngineFactory = std::function<std::unique_ptr<engine::Engine>()>;
// Delivers events to the supervisor connection that requested a session.
using EventSink = std::function<void(const arena::SupervisorEvent &)>;

struct CoordinatorOptions
{
    uint32_t max_parallel{2};
    uint32_t queue_soft_limit{16};
    uint16_t port_begin{20000};
    uint16_t port_end{20999};
    bool probe_ports{true};
    std::filesystem::path work_root{"/tmp/arena_sessions"};
    game::MatchDefaults defaults;
    game::SessionOptions session; // workdir and port are filled per session
};

struct SubmitResult
{
    bool accepted{false};
    uint64_t session_id{0};
    std::string reason;
};

struct AttachResult
{
    bool attached{false};
    uint64_t session_id{0};
    uint32_t slot{0};
};

// Owns every live MatchSession: registers new ones, hands bots to the
// session waiting for them, bounds how many run at once (FIFO admission) and
// returns engine ports to the pool when a session is gone.
class InstanceCoordinator final : public game::AdmissionGate
{
public:
    InstanceCoordinator(
        std::shared_ptr<coro::io_scheduler> scheduler,
        CoordinatorOptions options,
        EngineFactory engine_factory,
        results::ResultAggregator &aggregator);

    // Registers and starts a session, or rejects it (invalid config, queue
    // full, no port). On acceptance the sink receives Accepted before any
    // other event, and later exactly one result.
    SubmitResult submit(const arena::StartMatch &req, EventSink sink);

    bool can_attach(const std::string &player_id) const;
    // Hands the channel to the oldest session waiting for player_id.
    AttachResult attach_bot(const std::string &player_id, std::unique_ptr<net::Channel> &channel);

    bool abort(uint64_t session_id);
    void abort_all();

    coro::task<bool> acquire(uint64_t session_id, const std::atomic<bool> &abort) override;
    void release(uint64_t session_id) override;

    size_t registered() const;
    size_t running() const;
    size_t waiting() const;
    const engine::PortAllocator &ports() const { return m_ports; }

    // <work_root>/<pid>_<start ms>_<n>_session_<id>; distinct for every coordinator
    // sharing work_root, in this process or another.
    std::filesystem::path session_workdir(uint64_t session_id) const;

    // Resolves once no session is registered.
    coro::task<void> drain();

private:
    struct Entry
    {
        std::shared_ptr<game::MatchSession> session;
        uint16_t port{0};
        EventSink sink;
    };

    coro::task<void> run_session(std::shared_ptr<game::MatchSession> session, uint16_t port, EventSink sink);
    void update_gauges_locked();

    std::shared_ptr<coro::io_scheduler> m_scheduler;
    CoordinatorOptions m_options;
    EngineFactory m_engine_factory;
    results::ResultAggregator &m_aggregator;
    engine::PortAllocator m_ports;

    mutable std::mutex m_mutex;
    std::string m_instance_tag;
    uint64_t m_next_id{0};
    std::map<uint64_t, Entry> m_sessions; // ordered: oldest session first
    std::deque<uint64_t> m_admission; // sessions waiting for a run slot, by session id (request order)
    std::unordered_set<uint64_t> m_admitted;
};

} // namespace arena::coord
