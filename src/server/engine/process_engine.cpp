// SPDX-License-Identifier: Apache-2.0
#include "server/engine/process_engine.hpp"

#include "arena.pb.h"
#include "common/logger.hpp"

#include <coro/net/tcp/client.hpp>

namespace arena::engine {

using namespace std::chrono_literals;

ProcessEngine::ProcessEngine(std::shared_ptr<coro::io_scheduler> scheduler, ProcessEngineOptions options)
    : m_scheduler(std::move(scheduler)), m_options(std::move(options))
{}

ProcessEngine::~ProcessEngine()
{
    for (auto &ch : m_channels)
        ch.reset();
    m_child.kill_now();
}

coro::task<bool> ProcessEngine::start(EngineLaunch launch)
{
    if (m_options.executable.empty()) {
        m_error = "no engine executable configured";
        co_return false;
    }
    LaunchParams params;
    params.executable = m_options.executable;
    params.workdir = launch.workdir;
    params.args = expand_args(
        m_options.args,
        {{"port", std::to_string(launch.port)}, {"workdir", launch.workdir.string()}, {"map", launch.map}});
    params.extra_env.push_back("ARENA_ENGINE_PORT=" + std::to_string(launch.port));
    if (!m_child.spawn(params, m_error)) {
        log::error("[engine] launch failed: {}", m_error);
        co_return false;
    }
    m_deadline = std::chrono::steady_clock::now() + m_options.startup_timeout;
    for (uint32_t slot = 0; slot < 2; ++slot) {
        auto ch = co_await connect_slot(launch.port, slot, launch.players[slot]);
        if (!ch) {
            m_child.kill_now();
            co_return false;
        }
        m_channels[slot] = std::move(ch);
    }
    log::info("[engine] pid={} ready on port {}", m_child.pid(), launch.port);
    co_return true;
}

coro::task<std::unique_ptr<net::TcpChannel>> ProcessEngine::connect_slot(
    uint16_t port, uint32_t slot, std::string player)
{
    uint32_t attempts = 0;
    while (std::chrono::steady_clock::now() < m_deadline) {
        if (!m_child.running()) {
            m_error = "engine exited during startup (" + m_child.describe_exit() + ")";
            co_return nullptr;
        }
        ++attempts;
        coro::net::tcp::client cli{
            m_scheduler, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = port}};
        auto st = co_await cli.connect(1s);
        if (st != coro::net::connect_status::connected) {
            log::trace("[engine] slot={} connect attempt {} status not connected", slot, attempts);
            co_await m_scheduler->yield_for(m_options.connect_retry);
            continue;
        }
        auto ch = std::make_unique<net::TcpChannel>(std::move(cli));
        arena::Request attach;
        attach.mutable_attach()->set_slot(slot);
        attach.mutable_attach()->set_player_name(player);
        std::string payload;
        attach.SerializeToString(&payload);
        if (!co_await ch->send_frame(std::move(payload))) {
            m_error = "engine closed control stream during attach";
            co_return nullptr;
        }
        auto rr = co_await ch->recv_frame(m_options.handshake_timeout);
        arena::Response resp;
        if (rr.status != net::recv_status::frame || !resp.ParseFromString(rr.payload) || !resp.has_attach()
            || resp.attach().slot() != slot || resp.error_size() > 0) {
            m_error = "engine rejected attach for slot " + std::to_string(slot);
            co_return nullptr;
        }
        log::debug("[engine] slot={} attached after {} attempt(s)", slot, attempts);
        co_return ch;
    }
    m_error = "engine did not accept connections within " + std::to_string(m_options.startup_timeout.count()) + "ms";
    co_return nullptr;
}

bool ProcessEngine::is_alive()
{
    return m_child.running();
}

coro::task<void> ProcessEngine::terminate(std::chrono::milliseconds grace)
{
    for (auto &ch : m_channels) {
        if (ch)
            ch->close();
    }
    if (m_child.pid() > 0) {
        bool graceful = co_await m_child.terminate(m_scheduler, grace);
        log::info(
            "[engine] pid={} stopped ({}{})", m_child.pid(), m_child.describe_exit(), graceful ? "" : ", forced");
    }
    co_return;
}

coro::task<bool> ProcessEngine::send_frame(uint32_t slot, std::string payload)
{
    if (slot > 1 || !m_channels[slot])
        co_return false;
    co_return co_await m_channels[slot]->send_frame(std::move(payload));
}

coro::task<net::RecvResult> ProcessEngine::recv_frame(uint32_t slot, std::chrono::milliseconds timeout)
{
    if (slot > 1 || !m_channels[slot])
        co_return net::RecvResult{net::recv_status::closed, {}};
    co_return co_await m_channels[slot]->recv_frame(timeout);
}

} // namespace arena::engine
