// SPDX-License-Identifier: Apache-2.0
// e2e_match_flow.cpp
// Full stack over TCP: gateway + coordinator + real engine child process
// (arena_fake_engine). A supervisor requests matches, two bots play them.
#include "arena.pb.h"
#include "server/coordinator/instance_coordinator.hpp"
#include "server/engine/process_engine.hpp"
#include "server/net/channel.hpp"
#include "server/net/listener.hpp"
#include "server/results/result_aggregator.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <vector>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

struct BotReport
{
    bool accepted{false};
    uint32_t player_id{0};
    uint32_t steps{0};
    uint32_t denied{0};
};

coro::task<std::unique_ptr<arena::net::TcpChannel>> connect(std::shared_ptr<coro::io_scheduler> sched, uint16_t port)
{
    for (int attempt = 0; attempt < 50; ++attempt) {
        coro::net::tcp::client cli{sched, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = port}};
        auto st = co_await cli.connect(1s);
        if (st == coro::net::connect_status::connected)
            co_return std::make_unique<arena::net::TcpChannel>(std::move(cli));
        co_await sched->yield_for(50ms);
    }
    co_return nullptr;
}

coro::task<bool> send(arena::net::Channel &ch, const google::protobuf::Message &msg)
{
    std::string out;
    msg.SerializeToString(&out);
    co_return co_await ch.send_frame(std::move(out));
}

template <typename T>
coro::task<bool> recv(arena::net::Channel &ch, T &msg, std::chrono::milliseconds timeout)
{
    auto rr = co_await ch.recv_frame(timeout);
    co_return rr.status == arena::net::recv_status::frame && msg.ParseFromString(rr.payload);
}

coro::task<arena::HelloAck> hello(arena::net::Channel &ch, bool supervisor, const std::string &player)
{
    arena::ClientHello h;
    h.set_supervisor(supervisor);
    h.set_player_id(player);
    h.set_client_version("e2e");
    bool sent = co_await send(ch, h);
    assert(sent);
    arena::HelloAck ack;
    bool got = co_await recv(ch, ack, 5s);
    assert(got);
    co_return ack;
}

// Plays until the proxy closes the connection. Sends a debug request every
// tenth step to exercise the filter.
coro::task<BotReport> bot(std::shared_ptr<coro::io_scheduler> sched, uint16_t port, std::string name)
{
    co_await sched->schedule();
    BotReport rep;
    auto ch = co_await connect(sched, port);
    assert(ch);
    auto ack = co_await hello(*ch, false, name);
    rep.accepted = ack.accepted();
    if (!rep.accepted)
        co_return rep;
    arena::Response joined;
    if (!co_await recv(*ch, joined, 20s) || !joined.has_join_game())
        co_return rep;
    rep.player_id = joined.join_game().player_id();
    for (uint32_t id = 1;; ++id) {
        if (id % 10 == 0) {
            arena::Request dbg;
            dbg.set_id(id);
            dbg.mutable_debug()->set_payload("draw");
            if (!co_await send(*ch, dbg))
                break;
            arena::Response dr;
            if (!co_await recv(*ch, dr, 20s))
                break;
            if (dr.error_size() > 0 && dr.error(0) == "Proxy: Request denied")
                ++rep.denied;
        }
        arena::Request step;
        step.set_id(id);
        step.mutable_step()->set_count(1);
        if (!co_await send(*ch, step))
            break;
        arena::Response sr;
        if (!co_await recv(*ch, sr, 20s))
            break;
        if (sr.has_step())
            rep.steps = sr.step().game_loop();
    }
    co_return rep;
}

coro::task<arena::MatchReport> supervise(
    std::shared_ptr<coro::io_scheduler> sched, uint16_t port, arena::StartMatch start, bool with_bots)
{
    co_await sched->schedule();
    auto ch = co_await connect(sched, port);
    assert(ch);
    auto ack = co_await hello(*ch, true, "");
    assert(ack.accepted());

    arena::SupervisorRequest ping;
    ping.mutable_ping()->set_time_ms(1234);
    bool sent = co_await send(*ch, ping);
    assert(sent);
    arena::SupervisorEvent pong;
    bool got = co_await recv(*ch, pong, 5s);
    assert(got && pong.has_pong() && pong.pong().client_time_ms() == 1234);

    arena::SupervisorRequest req;
    *req.mutable_start_match() = start;
    sent = co_await send(*ch, req);
    assert(sent);
    arena::SupervisorEvent accepted;
    got = co_await recv(*ch, accepted, 5s);
    assert(got && accepted.has_accepted());

    // A second request while one is outstanding is refused
    sent = co_await send(*ch, req);
    assert(sent);
    arena::SupervisorEvent refused;
    got = co_await recv(*ch, refused, 5s);
    assert(got && refused.has_rejected());

    if (with_bots) {
        auto results = co_await coro::when_all(bot(sched, port, start.player1()), bot(sched, port, start.player2()));
        auto &a = std::get<0>(results).return_value();
        auto &b = std::get<1>(results).return_value();
        assert(a.accepted && b.accepted);
        assert(a.player_id == 1 && b.player_id == 2);
        if (start.disable_debug())
            assert(a.denied > 0 && b.denied > 0);
        else
            assert(a.denied == 0);
    }

    uint32_t connected = 0;
    while (true) {
        arena::SupervisorEvent ev;
        got = co_await recv(*ch, ev, 60s);
        assert(got);
        if (ev.has_bot_connected()) {
            ++connected;
            continue;
        }
        if (ev.has_result()) {
            if (with_bots)
                assert(connected == 2);
            co_return ev.result();
        }
    }
}

coro::task<void> rejected_handshakes(std::shared_ptr<coro::io_scheduler> sched, uint16_t port)
{
    co_await sched->schedule();
    // Bot nobody is waiting for
    auto ch = co_await connect(sched, port);
    assert(ch);
    auto ack = co_await hello(*ch, false, "stranger");
    assert(!ack.accepted() && !ack.reason().empty());
    // Bot hello without id
    ch = co_await connect(sched, port);
    ack = co_await hello(*ch, false, "");
    assert(!ack.accepted());
    // Undecodable hello
    ch = co_await connect(sched, port);
    bool sent = co_await ch->send_frame(std::string("\xff\xff\xff", 3));
    assert(sent);
    arena::HelloAck bad;
    bool got = co_await recv(*ch, bad, 5s);
    assert(got && !bad.accepted());
}

std::string read_file(const fs::path &p)
{
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

struct Stack
{
    std::unique_ptr<arena::results::ResultAggregator> aggregator;
    std::unique_ptr<arena::coord::InstanceCoordinator> coordinator;
};

Stack make_stack(
    std::shared_ptr<coro::io_scheduler> sched,
    const fs::path &root,
    uint16_t gateway_port,
    uint16_t engine_port_base,
    std::vector<std::string> engine_args)
{
    Stack s;
    s.aggregator = std::make_unique<arena::results::ResultAggregator>(root / "results.csv");
    arena::engine::ProcessEngineOptions eo;
    eo.executable = ARENA_FAKE_ENGINE_PATH;
    eo.args = std::move(engine_args);
    eo.startup_timeout = 10s;
    eo.connect_retry = 50ms;
    arena::coord::CoordinatorOptions co;
    co.max_parallel = 1;
    co.port_begin = engine_port_base;
    co.port_end = static_cast<uint16_t>(engine_port_base + 9);
    co.work_root = root / "sessions";
    co.session.player_connect_timeout = 10s;
    co.session.engine_response_timeout = 5s;
    co.session.shutdown_grace = 500ms;
    s.coordinator = std::make_unique<arena::coord::InstanceCoordinator>(
        sched,
        co,
        [sched, eo]() -> std::unique_ptr<arena::engine::Engine> {
            return std::make_unique<arena::engine::ProcessEngine>(sched, eo);
        },
        *s.aggregator);
    arena::net::GatewayOptions go;
    go.port = gateway_port;
    sched->spawn(arena::net::run_gateway(sched, go, *s.coordinator));
    return s;
}

} // namespace

int main()
{
    auto root = fs::temp_directory_path() / "arena_e2e_match_flow";
    fs::remove_all(root);
    fs::create_directories(root / "replays");
    auto sched = coro::default_executor::io_executor();
    // Gateways keep running until exit, so their coordinators must too
    std::vector<Stack> stacks;
    stacks.reserve(3);

    // Natural end reported by the engine, replay into a directory, debug filtered
    {
        auto &stack = stacks.emplace_back(make_stack(
            sched, root / "natural", 42610, 42700, {"--port", "{port}", "--end-at", "30", "--outcome", "p1"}));
        coro::sync_wait(rejected_handshakes(sched, 42610));
        arena::StartMatch start;
        start.set_map("E2EMap");
        start.set_match_id("e2e-1");
        start.set_player1("bot_a");
        start.set_player2("bot_b");
        start.set_max_game_steps(100);
        start.set_max_frame_time_ms(2000);
        start.set_strikes(3);
        start.set_disable_debug(true);
        start.set_replay_path((root / "replays").string() + "/");
        auto rep = coro::sync_wait(supervise(sched, 42610, start, true));
        assert(rep.outcome() == arena::MATCH_OUTCOME_PLAYER1_WIN);
        assert(rep.reason() == arena::END_REASON_ENGINE_REPORT);
        assert(rep.loser() == "bot_b");
        assert(rep.final_step() == 30);
        assert(rep.bots(0).strikes() == 0 && rep.bots(1).strikes() == 0);
        auto replay = root / "replays" / "e2e-1_bot_a_vs_bot_b.replay";
        assert(rep.replay_path() == replay.string());
        assert(read_file(replay) == "FAKE-REPLAY:E2EMap:30");
        assert(stack.coordinator->ports().in_use() == 0);
        auto csv = read_file(root / "natural" / "results.csv");
        assert(csv.find(",e2e-1,Player1Win,EngineReport,bot_b,30,") != std::string::npos);
        std::cout << "[e2e] natural end OK" << std::endl;
    }
    // Engine process dies mid-game
    {
        stacks.emplace_back(make_stack(sched, root / "crash", 42611, 42720, {"--port", "{port}", "--crash-at", "5"}));
        arena::StartMatch start;
        start.set_map("E2EMap");
        start.set_match_id("e2e-2");
        start.set_player1("bot_c");
        start.set_player2("bot_d");
        start.set_max_game_steps(100);
        start.set_max_frame_time_ms(2000);
        auto rep = coro::sync_wait(supervise(sched, 42611, start, true));
        assert(rep.outcome() == arena::MATCH_OUTCOME_CRASH);
        assert(rep.reason() == arena::END_REASON_ENGINE_CRASH);
        assert(rep.loser().empty());
        assert(rep.final_step() == 5);
        std::cout << "[e2e] engine crash OK" << std::endl;
    }
    // Supervisor aborts before any bot shows up
    {
        stacks.emplace_back(make_stack(sched, root / "abort", 42612, 42740, {"--port", "{port}"}));
        auto flow = [](std::shared_ptr<coro::io_scheduler> sc) -> coro::task<arena::MatchReport> {
            co_await sc->schedule();
            auto ch = co_await connect(sc, 42612);
            assert(ch);
            auto ack = co_await hello(*ch, true, "");
            assert(ack.accepted());
            arena::SupervisorRequest req;
            auto *sm = req.mutable_start_match();
            sm->set_map("E2EMap");
            sm->set_player1("bot_e");
            sm->set_player2("bot_f");
            bool sent = co_await send(*ch, req);
            assert(sent);
            arena::SupervisorEvent ev;
            bool got = co_await recv(*ch, ev, 5s);
            assert(got && ev.has_accepted());
            arena::SupervisorRequest abort;
            abort.mutable_abort();
            sent = co_await send(*ch, abort);
            assert(sent);
            while (true) {
                arena::SupervisorEvent r;
                got = co_await recv(*ch, r, 10s);
                assert(got);
                if (r.has_result())
                    co_return r.result();
            }
        };
        auto rep = coro::sync_wait(flow(sched));
        assert(rep.outcome() == arena::MATCH_OUTCOME_ERROR);
        assert(rep.reason() == arena::END_REASON_ABORTED);
        std::cout << "[e2e] supervisor abort OK" << std::endl;
    }
    for (auto &s : stacks) {
        s.coordinator->abort_all();
        coro::sync_wait(s.coordinator->drain());
    }
    std::cout << "e2e_match_flow OK" << std::endl;
    return 0;
}
