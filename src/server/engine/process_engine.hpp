// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/engine/engine.hpp"
#include "server/engine/process_launcher.hpp"

#include <coro/io_scheduler.hpp>

#include <array>
#include <memory>
#include <string>
#include <vector>

namespace arena::engine {

struct ProcessEngineOptions
{
    std::string executable;
    std::vector<std::string> args; // template: {port} {workdir} {map}
    std::chrono::milliseconds startup_timeout{60000};
    std::chrono::milliseconds connect_retry{250};
    std::chrono::milliseconds handshake_timeout{5000};
};

// Engine backed by a child process speaking the control protocol on
// 127.0.0.1:<port>. One TCP connection per player slot; the first frame on
// each is a proxy-generated attach request naming the slot.
class ProcessEngine final : public Engine
{
public:
    ProcessEngine(std::shared_ptr<coro::io_scheduler> scheduler, ProcessEngineOptions options);
    ~ProcessEngine() override;

    coro::task<bool> start(EngineLaunch launch) override;
    bool is_alive() override;
    coro::task<void> terminate(std::chrono::milliseconds grace) override;
    coro::task<bool> send_frame(uint32_t slot, std::string payload) override;
    coro::task<net::RecvResult> recv_frame(uint32_t slot, std::chrono::milliseconds timeout) override;
    std::string last_error() const override { return m_error; }

private:
    coro::task<std::unique_ptr<net::TcpChannel>> connect_slot(uint16_t port, uint32_t slot, std::string player);

    std::shared_ptr<coro::io_scheduler> m_scheduler;
    ProcessEngineOptions m_options;
    ChildProcess m_child;
    std::array<std::unique_ptr<net::TcpChannel>, 2> m_channels;
    std::chrono::steady_clock::time_point m_deadline{};
    std::string m_error;
};

} // namespace arena::engine
