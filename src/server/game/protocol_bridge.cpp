// SPDX-License-Identifier: Apache-2.0
#include "server/game/protocol_bridge.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>

namespace arena::game {

frame_kind classify(const arena::Request &req)
{
    switch (req.request_case()) {
        case arena::Request::kStep:
            return frame_kind::step;
        case arena::Request::kDebug:
            return frame_kind::debug;
        case arena::Request::kLeaveGame:
        case arena::Request::kQuit:
            return frame_kind::leave;
        default:
            return frame_kind::other;
    }
}

const char *to_string(exchange_status s)
{
    switch (s) {
        case exchange_status::stepped:
            return "stepped";
        case exchange_status::timed_out:
            return "timed_out";
        case exchange_status::decode_error:
            return "decode_error";
        case exchange_status::bot_disconnected:
            return "bot_disconnected";
        case exchange_status::surrendered:
            return "surrendered";
        case exchange_status::engine_closed:
            return "engine_closed";
        case exchange_status::aborted:
            return "aborted";
    }
    return "unknown";
}

ProtocolBridge::ProtocolBridge(uint32_t slot, net::Channel &bot, engine::Engine &engine, BridgeOptions options)
    : m_slot(slot), m_bot(bot), m_engine(engine), m_options(options)
{}

coro::task<bool> ProtocolBridge::send_to_bot(const arena::Response &resp)
{
    std::string payload;
    if (!resp.SerializeToString(&payload))
        co_return false;
    co_return co_await m_bot.send_frame(std::move(payload));
}

coro::task<bool> ProtocolBridge::reply_error(uint32_t id, const std::string &text)
{
    arena::Response resp;
    resp.set_id(id);
    resp.set_status(arena::STATUS_IN_GAME);
    resp.add_error(text);
    co_return co_await send_to_bot(resp);
}

// No-op step on behalf of the bot; the engine's reply is consumed here.
coro::task<void> ProtocolBridge::release_engine(ExchangeResult &res)
{
    arena::Request noop;
    noop.set_id(0);
    noop.mutable_step()->set_count(1);
    std::string payload;
    noop.SerializeToString(&payload);
    if (!co_await m_engine.send_frame(m_slot, std::move(payload))) {
        res.engine_lost = true;
        co_return;
    }
    auto rr = co_await m_engine.recv_frame(m_slot, m_options.engine_timeout);
    if (rr.status != net::recv_status::frame) {
        res.engine_lost = true;
        co_return;
    }
    arena::Response resp;
    if (resp.ParseFromString(rr.payload) && resp.has_step())
        res.step = resp.step();
}

coro::task<ExchangeResult> ProtocolBridge::run_step(
    std::chrono::milliseconds budget, const std::atomic<bool> &abort)
{
    using clock = std::chrono::steady_clock;
    ExchangeResult res;
    while (true) {
        if (abort.load(std::memory_order_acquire)) {
            res.status = exchange_status::aborted;
            co_await release_engine(res);
            co_return res;
        }
        auto remaining = budget - res.bot_time;
        if (remaining <= std::chrono::nanoseconds::zero()) {
            res.status = exchange_status::timed_out;
            res.bot_time = std::max<std::chrono::nanoseconds>(res.bot_time, budget);
            co_await release_engine(res);
            co_return res;
        }
        auto slice = std::min(
            std::chrono::ceil<std::chrono::milliseconds>(remaining), m_options.poll_slice);
        auto t0 = clock::now();
        auto rr = co_await m_bot.recv_frame(slice);
        res.bot_time += clock::now() - t0;
        if (rr.status == net::recv_status::timeout)
            continue;
        if (rr.status != net::recv_status::frame) {
            res.status = exchange_status::bot_disconnected;
            co_await release_engine(res);
            co_return res;
        }

        arena::Request req;
        if (!req.ParseFromString(rr.payload)) {
            metrics::inc(metrics::runtime().decode_errors_total);
            log::warn("[bridge] slot={} undecodable frame ({} bytes)", m_slot, rr.payload.size());
            res.status = exchange_status::decode_error;
            if (!co_await reply_error(0, "Proxy: malformed request"))
                res.status = exchange_status::bot_disconnected;
            co_await release_engine(res);
            co_return res;
        }

        auto kind = classify(req);
        if (kind == frame_kind::debug && m_options.disable_debug) {
            ++res.debug_blocked;
            metrics::inc(metrics::runtime().debug_frames_blocked);
            ARENA_LOG_EVERY_N(debug, 100, "[bridge] slot={} debug request denied id={}", m_slot, req.id());
            if (!co_await reply_error(req.id(), debug_denied_text)) {
                res.status = exchange_status::bot_disconnected;
                co_await release_engine(res);
                co_return res;
            }
            continue;
        }
        if (kind == frame_kind::leave) {
            log::info("[bridge] slot={} left the game", m_slot);
            arena::Response ack;
            ack.set_id(req.id());
            ack.set_status(arena::STATUS_ENDED);
            if (req.has_quit())
                ack.mutable_quit();
            else
                ack.mutable_leave_game();
            (void)co_await send_to_bot(ack);
            res.status = exchange_status::surrendered;
            co_await release_engine(res);
            co_return res;
        }

        if (kind == frame_kind::step)
            res.step_count = std::max<uint32_t>(req.step().count(), 1);

        // Verbatim forward; the engine answers every request on this slot.
        if (!co_await m_engine.send_frame(m_slot, std::move(rr.payload))) {
            res.engine_lost = true;
            res.status = exchange_status::engine_closed;
            co_return res;
        }
        auto reply_timeout = kind == frame_kind::step ? m_options.engine_timeout + budget : m_options.engine_timeout;
        auto er = co_await m_engine.recv_frame(m_slot, reply_timeout);
        if (er.status != net::recv_status::frame) {
            log::warn(
                "[bridge] slot={} engine reply missing ({})",
                m_slot,
                er.status == net::recv_status::timeout ? "timeout" : "closed");
            res.engine_lost = true;
            res.status = exchange_status::engine_closed;
            co_return res;
        }
        if (kind == frame_kind::step) {
            arena::Response resp;
            if (resp.ParseFromString(er.payload) && resp.has_step())
                res.step = resp.step();
        }
        ++res.frames_relayed;
        metrics::inc(metrics::runtime().frames_relayed);
        bool delivered = co_await m_bot.send_frame(std::move(er.payload));
        if (kind == frame_kind::step) {
            // The engine already holds this slot's step, no substitute needed.
            res.status = delivered ? exchange_status::stepped : exchange_status::bot_disconnected;
            co_return res;
        }
        if (!delivered) {
            res.status = exchange_status::bot_disconnected;
            co_await release_engine(res);
            co_return res;
        }
    }
}

} // namespace arena::game
