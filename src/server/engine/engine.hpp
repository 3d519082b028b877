// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/net/channel.hpp"

#include <coro/coro.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace arena::engine {

struct EngineLaunch
{
    uint16_t port{0};
    std::filesystem::path workdir;
    std::string map;
    std::array<std::string, 2> players;
};

// Capability object for one game-engine instance. Match logic depends only
// on this interface; tests substitute an in-memory engine.
// Frames are addressed per player slot (0 or 1); each slot is a strict
// request/response stream.
class Engine
{
public:
    virtual ~Engine() = default;

    // Launches the engine and opens one control stream per slot.
    virtual coro::task<bool> start(EngineLaunch launch) = 0;
    virtual bool is_alive() = 0;
    // Graceful stop, forced after grace. Must be safe to call more than once
    // and when start() failed.
    virtual coro::task<void> terminate(std::chrono::milliseconds grace) = 0;
    virtual coro::task<bool> send_frame(uint32_t slot, std::string payload) = 0;
    virtual coro::task<net::RecvResult> recv_frame(uint32_t slot, std::chrono::milliseconds timeout) = 0;
    // Reason for the last start() failure.
    virtual std::string last_error() const = 0;
};

} // namespace arena::engine
