// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "arena.pb.h"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/net/channel.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace arena::net {

namespace {

// Outbound state of one supervisor connection, shared with the event sink
// handed to the coordinator.
struct SupervisorLink
{
    std::mutex mutex;
    std::vector<arena::SupervisorEvent> outbox;
    uint64_t outstanding{0}; // session awaiting its result, 0 = none
};

void push_event(const std::shared_ptr<SupervisorLink> &link, const arena::SupervisorEvent &ev)
{
    std::scoped_lock lk{link->mutex};
    if (ev.has_accepted())
        link->outstanding = ev.accepted().session_id();
    else if (ev.has_result() && ev.result().session_id() == link->outstanding)
        link->outstanding = 0;
    link->outbox.push_back(ev);
}

std::vector<arena::SupervisorEvent> drain_events(const std::shared_ptr<SupervisorLink> &link)
{
    std::scoped_lock lk{link->mutex};
    std::vector<arena::SupervisorEvent> out;
    out.swap(link->outbox);
    return out;
}

uint64_t outstanding_of(const std::shared_ptr<SupervisorLink> &link)
{
    std::scoped_lock lk{link->mutex};
    return link->outstanding;
}

uint64_t now_ms()
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count());
}

coro::task<bool> send_message(Channel &ch, const google::protobuf::Message &msg)
{
    std::string out;
    if (!msg.SerializeToString(&out)) {
        log::error("[gateway] failed to serialize {}", msg.GetTypeName());
        co_return false;
    }
    co_return co_await ch.send_frame(std::move(out));
}

coro::task<void> reject(Channel &ch, const std::string &reason)
{
    metrics::inc(metrics::runtime().handshakes_rejected);
    log::warn("[gateway] handshake rejected: {}", reason);
    arena::HelloAck ack;
    ack.set_accepted(false);
    ack.set_reason(reason);
    (void)co_await send_message(ch, ack);
    ch.close();
}

void handle_request(
    const arena::SupervisorRequest &req,
    const std::shared_ptr<SupervisorLink> &link,
    coord::InstanceCoordinator &coordinator)
{
    if (req.has_start_match()) {
        if (uint64_t busy = outstanding_of(link)) {
            arena::SupervisorEvent ev;
            ev.mutable_rejected()->set_reason("session " + std::to_string(busy) + " still outstanding");
            push_event(link, ev);
            return;
        }
        auto res = coordinator.submit(req.start_match(), [link](const arena::SupervisorEvent &ev) {
            push_event(link, ev);
        });
        if (!res.accepted) {
            arena::SupervisorEvent ev;
            ev.mutable_rejected()->set_reason(res.reason);
            push_event(link, ev);
        }
    } else if (req.has_ping()) {
        arena::SupervisorEvent ev;
        ev.mutable_pong()->set_client_time_ms(req.ping().time_ms());
        ev.mutable_pong()->set_server_time_ms(now_ms());
        push_event(link, ev);
    } else if (req.has_abort()) {
        uint64_t id = req.abort().session_id() ? req.abort().session_id() : outstanding_of(link);
        if (id == 0 || !coordinator.abort(id)) {
            arena::SupervisorEvent ev;
            ev.mutable_rejected()->set_reason("no such session to abort");
            push_event(link, ev);
        }
    } else {
        log::debug("[gateway] empty supervisor request ignored");
    }
}

coro::task<void> supervisor_loop(
    std::unique_ptr<TcpChannel> ch, const GatewayOptions &options, coord::InstanceCoordinator &coordinator)
{
    arena::HelloAck ack;
    ack.set_accepted(true);
    if (!co_await send_message(*ch, ack))
        co_return;
    log::info("[gateway] supervisor connected");
    auto link = std::make_shared<SupervisorLink>();
    while (true) {
        // Flush pending events first
        bool gone = false;
        for (auto &ev : drain_events(link)) {
            if (!co_await send_message(*ch, ev)) {
                gone = true;
                break;
            }
        }
        if (gone)
            break;
        auto rr = co_await ch->recv_frame(options.poll_interval);
        if (rr.status == recv_status::timeout)
            continue;
        if (rr.status != recv_status::frame)
            break;
        arena::SupervisorRequest req;
        if (!req.ParseFromString(rr.payload)) {
            log::warn("[gateway] undecodable supervisor request, dropping connection");
            break;
        }
        handle_request(req, link, coordinator);
    }
    if (uint64_t id = outstanding_of(link)) {
        log::warn("[gateway] supervisor gone with session {} outstanding, aborting it", id);
        coordinator.abort(id);
    } else {
        log::info("[gateway] supervisor disconnected");
    }
}

coro::task<void> bot_handoff(
    std::unique_ptr<TcpChannel> ch, const std::string &player_id, coord::InstanceCoordinator &coordinator)
{
    if (!coordinator.can_attach(player_id)) {
        co_await reject(*ch, "no session awaits player " + player_id);
        co_return;
    }
    arena::HelloAck ack;
    ack.set_accepted(true);
    if (!co_await send_message(*ch, ack))
        co_return;
    std::unique_ptr<Channel> owned = std::move(ch);
    auto res = coordinator.attach_bot(player_id, owned);
    if (!res.attached) {
        // slot filled by a concurrent connection with the same id
        log::warn("[gateway] player {} lost the attach race, closing", player_id);
        owned->close();
        co_return;
    }
    log::info("[gateway] bot {} routed to session {} slot {}", player_id, res.session_id, res.slot);
}

coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    coro::net::tcp::client client,
    GatewayOptions options,
    coord::InstanceCoordinator &coordinator)
{
    co_await scheduler->schedule();
    try {
        auto ch = std::make_unique<TcpChannel>(std::move(client));
        auto rr = co_await ch->recv_frame(options.handshake_timeout);
        if (rr.status != recv_status::frame) {
            metrics::inc(metrics::runtime().handshakes_rejected);
            log::warn("[gateway] no handshake within {}ms, closing", options.handshake_timeout.count());
            co_return;
        }
        arena::ClientHello hello;
        if (!hello.ParseFromString(rr.payload)) {
            co_await reject(*ch, "malformed handshake");
            co_return;
        }
        if (hello.supervisor()) {
            co_await supervisor_loop(std::move(ch), options, coordinator);
        } else if (hello.player_id().empty()) {
            co_await reject(*ch, "bot handshake without player id");
        } else {
            co_await bot_handoff(std::move(ch), hello.player_id(), coordinator);
        }
    } catch (const std::exception &ex) {
        log::error("[gateway] connection failed: {}", ex.what());
    }
}

} // namespace

coro::task<void> run_gateway(
    std::shared_ptr<coro::io_scheduler> scheduler, GatewayOptions options, coord::InstanceCoordinator &coordinator)
{
    co_await scheduler->schedule();
    log::info("[gateway] listening on {}:{}", options.address, options.port);
    coro::net::tcp::server server{
        scheduler,
        coro::net::tcp::server::options{
            .address = coro::net::ip_address::from_string(options.address), .port = options.port}};
    while (true) {
        auto status = co_await server.poll();
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                metrics::inc(metrics::runtime().connections_accepted);
                scheduler->spawn(connection_loop(scheduler, std::move(client), options, coordinator));
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            log::error("[gateway] poll error/closed, exiting accept loop");
            co_return;
        }
    }
}

} // namespace arena::net
