// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "arena.pb.h"
#include "server/engine/engine.hpp"
#include "server/net/channel.hpp"

#include <coro/coro.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace arena::game {

// Message-type classes the bridge needs; everything else is opaque.
enum class frame_kind
{
    step, // step boundary
    debug, // debug-command category
    leave, // leave_game / quit: the bot gives up
    other
};

frame_kind classify(const arena::Request &req);

// Reply sent in place of a filtered debug request.
inline constexpr const char *debug_denied_text = "Proxy: Request denied";

enum class exchange_status
{
    stepped, // bot issued its step request within budget
    timed_out, // budget exhausted before the bot's step request
    decode_error, // bot sent a frame that failed to decode
    bot_disconnected,
    surrendered,
    engine_closed, // engine stream lost or engine reply timed out
    aborted
};

const char *to_string(exchange_status s);

struct ExchangeResult
{
    exchange_status status{exchange_status::aborted};
    std::chrono::nanoseconds bot_time{0}; // time spent waiting for the bot
    uint32_t frames_relayed{0};
    uint32_t debug_blocked{0};
    bool engine_lost{false}; // engine stream failed at any point of the exchange
    uint32_t step_count{1}; // simulation steps asked for by the step request (or the no-op)
    std::optional<arena::ResponseStep> step; // engine's answer to the step request
};

struct BridgeOptions
{
    bool disable_debug{false};
    std::chrono::milliseconds engine_timeout{60000};
    std::chrono::milliseconds poll_slice{50}; // abort flag checked between slices
};

// Relays one bot's traffic to its engine slot for one step at a time.
// Bot frames are forwarded verbatim except filtered debug requests; engine
// replies are forwarded verbatim. When the bot does not reach its step
// request (timeout, disconnect, surrender, decode error, abort) the bridge
// substitutes a no-op step so a lockstep engine is never left waiting.
class ProtocolBridge
{
public:
    ProtocolBridge(uint32_t slot, net::Channel &bot, engine::Engine &engine, BridgeOptions options);

    coro::task<ExchangeResult> run_step(std::chrono::milliseconds budget, const std::atomic<bool> &abort);

    // Proxy-originated frame to the bot (join reply, shutdown notices).
    coro::task<bool> send_to_bot(const arena::Response &resp);

    uint32_t slot() const { return m_slot; }

private:
    coro::task<void> release_engine(ExchangeResult &res);
    coro::task<bool> reply_error(uint32_t id, const std::string &text);

    uint32_t m_slot;
    net::Channel &m_bot;
    engine::Engine &m_engine;
    BridgeOptions m_options;
};

} // namespace arena::game
