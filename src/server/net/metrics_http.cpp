// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <atomic>
#include <span>
#include <sstream>
#include <string>

namespace arena::net {

namespace {

void counter(std::ostringstream &oss, const char *name, const std::atomic<uint64_t> &v)
{
    oss << "# TYPE " << name << " counter\n" << name << ' ' << v.load(std::memory_order_relaxed) << "\n";
}

void gauge(std::ostringstream &oss, const char *name, uint64_t v)
{
    oss << "# TYPE " << name << " gauge\n" << name << ' ' << v << "\n";
}

} // namespace

std::string build_metrics_body()
{
    std::ostringstream oss;
    auto &rt = arena::metrics::runtime();
    // Session gauges
    gauge(oss, "arena_active_sessions", rt.active_sessions.load());
    gauge(oss, "arena_queued_sessions", rt.queued_sessions.load());
    counter(oss, "arena_sessions_started", rt.sessions_started);
    counter(oss, "arena_sessions_completed", rt.sessions_completed);
    counter(oss, "arena_sessions_failed", rt.sessions_failed);
    counter(oss, "arena_sessions_rejected", rt.sessions_rejected);
    counter(oss, "arena_connections_accepted", rt.connections_accepted);
    counter(oss, "arena_handshakes_rejected", rt.handshakes_rejected);
    counter(oss, "arena_strikes_total", rt.strikes_total);
    counter(oss, "arena_decode_errors_total", rt.decode_errors_total);
    counter(oss, "arena_debug_frames_blocked", rt.debug_frames_blocked);
    counter(oss, "arena_frames_relayed", rt.frames_relayed);
    counter(oss, "arena_bot_disconnects", rt.bot_disconnects);
    counter(oss, "arena_engine_launch_failures", rt.engine_launch_failures);
    counter(oss, "arena_engine_crashes", rt.engine_crashes);
    counter(oss, "arena_engine_forced_kills", rt.engine_forced_kills);
    counter(oss, "arena_result_persist_failures", rt.result_persist_failures);
    gauge(oss, "arena_avg_step_ns", arena::metrics::avg_step_ns());
    gauge(oss, "arena_p99_step_ns", arena::metrics::approx_step_p99());
    // Step duration histogram (nanoseconds), geometric buckets from 1ms.
    oss << "# TYPE arena_step_duration_ns histogram\n";
    uint64_t cumulative = 0;
    for (int i = 0; i < arena::metrics::RuntimeCounters::STEP_BUCKETS; ++i) {
        cumulative += rt.step_hist[i].load();
        uint64_t le = arena::metrics::RuntimeCounters::step_bucket_base_ns << i;
        oss << "arena_step_duration_ns_bucket{le=\"" << le << "\"} " << cumulative << "\n";
    }
    oss << "arena_step_duration_ns_bucket{le=\"+Inf\"} " << cumulative << "\n";
    oss << "arena_step_duration_ns_sum " << rt.step_duration_ns_accum.load() << "\n";
    oss << "arena_step_duration_ns_count " << rt.step_samples.load() << "\n";
    return oss.str();
}

static coro::task<void> handle_client(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    // Very small timeout; one-shot request
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event) {
        co_return;
    }
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok && rs != coro::net::recv_status::would_block)
        co_return;
    // naive method/path parse
    std::string_view req(span.data(), span.size());
    bool metrics = req.rfind("GET /metrics", 0) == 0;
    std::string body = metrics ? build_metrics_body() : std::string("not found\n");
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (metrics ? "200 OK" : "404 Not Found") << "\r\n";
    resp << "Content-Type: text/plain; version=0.0.4\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    auto s = resp.str();
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, rest] = client.send(out);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            out = rest;
            continue;
        }
        break;
    }
    co_return;
}

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port)
{
    co_await scheduler->schedule();
    arena::log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto st = co_await server.poll();
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                scheduler->spawn(handle_client(scheduler, std::move(client)));
            }
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            arena::log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
}

} // namespace arena::net
