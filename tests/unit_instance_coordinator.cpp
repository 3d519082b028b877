// SPDX-License-Identifier: Apache-2.0
// unit_instance_coordinator.cpp
// Session registry: rejection paths, bot routing, admission in request order
// under the parallel limit, abort, and port/registry/workdir cleanup.
#include "server/coordinator/instance_coordinator.hpp"
#include "test_fakes.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <vector>

using namespace std::chrono_literals;
using arena::testing::BotScript;
using arena::testing::EngineScript;
using arena::testing::FakeEngine;
using arena::testing::ScriptedBot;

namespace {

struct EventLog
{
    std::mutex mutex;
    std::vector<std::pair<std::string, arena::SupervisorEvent>> events; // tag -> event, arrival order

    arena::coord::EventSink sink(std::string tag)
    {
        return [this, tag](const arena::SupervisorEvent &ev) {
            std::scoped_lock lk{mutex};
            events.emplace_back(tag, ev);
        };
    }

    std::vector<arena::SupervisorEvent> of(const std::string &tag)
    {
        std::scoped_lock lk{mutex};
        std::vector<arena::SupervisorEvent> out;
        for (auto &[t, ev] : events) {
            if (t == tag)
                out.push_back(ev);
        }
        return out;
    }

    std::vector<std::string> result_order()
    {
        std::scoped_lock lk{mutex};
        std::vector<std::string> out;
        for (auto &[t, ev] : events) {
            if (ev.has_result())
                out.push_back(t);
        }
        return out;
    }
};

arena::StartMatch request(const std::string &id, const std::string &p1, const std::string &p2)
{
    arena::StartMatch req;
    req.set_map("TestMap");
    req.set_match_id(id);
    req.set_player1(p1);
    req.set_player2(p2);
    req.set_max_game_steps(20);
    req.set_max_frame_time_ms(100);
    req.set_strikes(5);
    return req;
}

arena::coord::CoordinatorOptions options(const std::string &name)
{
    arena::coord::CoordinatorOptions o;
    o.max_parallel = 1;
    o.queue_soft_limit = 4;
    o.port_begin = 42000;
    o.port_end = 42001;
    o.probe_ports = false;
    o.work_root = std::filesystem::temp_directory_path() / "arena_unit_coord" / name;
    o.session.player_connect_timeout = 3000ms;
    o.session.engine_response_timeout = 2000ms;
    o.session.shutdown_grace = 50ms;
    return o;
}

bool attach(
    arena::coord::InstanceCoordinator &coord,
    std::shared_ptr<coro::io_scheduler> sched,
    const std::string &who,
    std::chrono::milliseconds late_delay = 150ms)
{
    BotScript slow;
    slow.late_windows = {3};
    slow.late_delay = late_delay;
    std::unique_ptr<arena::net::Channel> ch = std::make_unique<ScriptedBot>(sched, slow);
    return coord.attach_bot(who, ch).attached;
}

coro::task<void> admission_flow(std::shared_ptr<coro::io_scheduler> sched, const std::filesystem::path &csv)
{
    co_await sched->schedule();
    EventLog log;
    arena::results::ResultAggregator agg(csv);
    arena::coord::InstanceCoordinator coord(
        sched,
        options("admission"),
        [sched]() { return std::make_unique<FakeEngine>(sched, EngineScript{}); },
        agg);

    auto bad = coord.submit(request("bad", "x", "x"), log.sink("bad"));
    assert(!bad.accepted && bad.reason.find("invalid match config") == 0);

    auto a = coord.submit(request("A", "a1", "a2"), log.sink("A"));
    auto b = coord.submit(request("B", "b1", "b2"), log.sink("B"));
    assert(a.accepted && b.accepted && a.session_id != b.session_id);
    assert(coord.registered() == 2);
    // Two ports in the pool, both held
    auto c = coord.submit(request("C", "c1", "c2"), log.sink("C"));
    assert(!c.accepted && c.reason == "no free engine port");
    assert(log.of("A").front().has_accepted());
    assert(log.of("A").front().accepted().session_id() == a.session_id);

    assert(coord.can_attach("b2"));
    assert(!coord.can_attach("nobody"));
    assert(attach(coord, sched, "a1"));
    assert(attach(coord, sched, "a2"));
    assert(!coord.can_attach("a1"));
    assert(!attach(coord, sched, "a1"));
    assert(attach(coord, sched, "b1"));
    assert(attach(coord, sched, "b2"));
    auto bc = log.of("B");
    assert(bc.size() == 3 && bc[1].has_bot_connected() && bc[2].bot_connected().player_id() == "b2");
    assert(bc[2].bot_connected().slot() == 1);

    size_t max_running = 0;
    while (coord.registered() > 0) {
        max_running = std::max(max_running, coord.running());
        co_await sched->yield_for(5ms);
    }
    assert(max_running == 1);
    auto order = log.result_order();
    assert(order.size() == 2 && order[0] == "A" && order[1] == "B");
    auto ra = log.of("A").back().result();
    assert(ra.session_id() == a.session_id && ra.match_id() == "A");
    assert(ra.outcome() == arena::MATCH_OUTCOME_TIE && ra.reason() == arena::END_REASON_MAX_DURATION);
    assert(ra.final_step() == 20);
    assert(ra.bots_size() == 2 && ra.bots(0).player_id() == "a1");
    assert(coord.ports().in_use() == 0);
    assert(coord.running() == 0 && coord.waiting() == 0);
    // Session directories are gone once the results are out
    assert(!std::filesystem::exists(coord.session_workdir(a.session_id)));
    assert(!std::filesystem::exists(coord.session_workdir(b.session_id)));
}

// A later request whose bots are ready first still waits behind an earlier
// one for the run slot.
coro::task<void> request_order_flow(std::shared_ptr<coro::io_scheduler> sched, const std::filesystem::path &csv)
{
    co_await sched->schedule();
    EventLog log;
    arena::results::ResultAggregator agg(csv);
    auto opts = options("order");
    opts.port_begin = 42010;
    opts.port_end = 42012;
    arena::coord::InstanceCoordinator coord(
        sched, opts, [sched]() { return std::make_unique<FakeEngine>(sched, EngineScript{}); }, agg);

    // The running session's replay target is unwritable: it falls back into its workdir
    std::filesystem::create_directories(opts.work_root);
    auto blocker = opts.work_root / "blocker";
    std::ofstream(blocker) << "file, not a directory";
    auto runner = request("R", "r1", "r2");
    runner.set_strikes(10);
    runner.set_replay_path((blocker / "r.replay").string());

    auto r = coord.submit(runner, log.sink("R"));
    auto a = coord.submit(request("A", "a1", "a2"), log.sink("A"));
    auto b = coord.submit(request("B", "b1", "b2"), log.sink("B"));
    assert(r.accepted && a.accepted && b.accepted);

    assert(attach(coord, sched, "r1", 400ms));
    assert(attach(coord, sched, "r2", 400ms));
    while (coord.running() == 0)
        co_await sched->yield_for(5ms);
    assert(attach(coord, sched, "b1"));
    assert(attach(coord, sched, "b2"));
    while (coord.waiting() == 0)
        co_await sched->yield_for(5ms);
    assert(attach(coord, sched, "a1"));
    assert(attach(coord, sched, "a2"));

    while (coord.registered() > 0)
        co_await sched->yield_for(5ms);
    auto order = log.result_order();
    assert(order.size() == 3 && order[0] == "R" && order[1] == "A" && order[2] == "B");

    auto kept = coord.session_workdir(r.session_id) / "R_r1_vs_r2.replay";
    assert(log.of("R").back().result().replay_path() == kept.string());
    assert(std::filesystem::exists(kept));
    assert(!std::filesystem::exists(coord.session_workdir(a.session_id)));
    assert(!std::filesystem::exists(coord.session_workdir(b.session_id)));
}

// A session aborted while queued is never admitted, even with capacity free.
coro::task<void> aborted_waiter(std::shared_ptr<coro::io_scheduler> sched, const std::filesystem::path &csv)
{
    co_await sched->schedule();
    arena::results::ResultAggregator agg(csv);
    arena::coord::InstanceCoordinator coord(
        sched, options("gate"), [sched]() { return std::make_unique<FakeEngine>(sched, EngineScript{}); }, agg);
    std::atomic<bool> aborted{true};
    bool admitted = co_await coord.acquire(77, aborted);
    assert(!admitted);
    assert(coord.running() == 0 && coord.waiting() == 0);
    std::atomic<bool> live{false};
    admitted = co_await coord.acquire(78, live);
    assert(admitted && coord.running() == 1);
    coord.release(78);
    assert(coord.running() == 0);
}

// Two proxies sharing one work root never share a session directory.
void workdir_names(std::shared_ptr<coro::io_scheduler> sched, const std::filesystem::path &csv)
{
    arena::results::ResultAggregator agg(csv);
    auto factory = [sched]() -> std::unique_ptr<arena::engine::Engine> {
        return std::make_unique<FakeEngine>(sched, EngineScript{});
    };
    arena::coord::InstanceCoordinator first(sched, options("names"), factory, agg);
    arena::coord::InstanceCoordinator second(sched, options("names"), factory, agg);
    assert(first.session_workdir(1) != second.session_workdir(1));
    assert(first.session_workdir(1) != first.session_workdir(2));
    assert(first.session_workdir(1).parent_path() == options("names").work_root);
}

coro::task<void> abort_flow(std::shared_ptr<coro::io_scheduler> sched, const std::filesystem::path &csv)
{
    co_await sched->schedule();
    EventLog log;
    arena::results::ResultAggregator agg(csv);
    auto opts = options("abort");
    opts.queue_soft_limit = 1;
    arena::coord::InstanceCoordinator coord(
        sched, opts, [sched]() { return std::make_unique<FakeEngine>(sched, EngineScript{}); }, agg);

    auto x = coord.submit(request("X", "x1", "x2"), log.sink("X"));
    assert(x.accepted);
    auto y = coord.submit(request("Y", "y1", "y2"), log.sink("Y"));
    assert(!y.accepted && y.reason == "queue full");
    assert(!coord.abort(x.session_id + 100));
    assert(coord.abort(x.session_id));
    co_await coord.drain();
    auto ev = log.of("X");
    assert(ev.size() == 2 && ev[0].has_accepted() && ev[1].has_result());
    assert(ev[1].result().outcome() == arena::MATCH_OUTCOME_ERROR);
    assert(ev[1].result().reason() == arena::END_REASON_ABORTED);
    assert(coord.ports().in_use() == 0);
    // Registry slot is free again
    auto z = coord.submit(request("Z", "z1", "z2"), log.sink("Z"));
    assert(z.accepted);
    coord.abort_all();
    co_await coord.drain();
    assert(log.of("Z").back().has_result());
}

} // namespace

int main()
{
    auto dir = std::filesystem::temp_directory_path() / "arena_unit_coord";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    auto sched = coro::default_executor::io_executor();
    coro::sync_wait(admission_flow(sched, dir / "admission.csv"));
    coro::sync_wait(abort_flow(sched, dir / "abort.csv"));
    coro::sync_wait(request_order_flow(sched, dir / "order.csv"));
    coro::sync_wait(aborted_waiter(sched, dir / "gate.csv"));
    workdir_names(sched, dir / "names.csv");
    // one row per finished session plus the header
    std::ifstream in(dir / "admission.csv");
    int lines = 0;
    for (std::string line; std::getline(in, line);)
        ++lines;
    assert(lines == 3);
    std::cout << "unit_instance_coordinator OK" << std::endl;
    return 0;
}
