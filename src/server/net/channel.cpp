// SPDX-License-Identifier: Apache-2.0
#include "server/net/channel.hpp"

#include "common/logger.hpp"

#include <coro/poll.hpp>

namespace arena::net {

coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        auto pstat = co_await client.poll(coro::poll_op::write);
        if (pstat == coro::poll_status::error || pstat == coro::poll_status::closed)
            co_return false;
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

TcpChannel::TcpChannel(coro::net::tcp::client client)
    : m_client(std::make_unique<coro::net::tcp::client>(std::move(client)))
{}

coro::task<bool> TcpChannel::send_frame(std::string payload)
{
    if (!m_client)
        co_return false;
    auto frame = netutil::build_frame(payload);
    bool ok = co_await send_all(*m_client, std::span<const char>(frame.data(), frame.size()));
    if (!ok)
        close();
    co_return ok;
}

coro::task<RecvResult> TcpChannel::recv_frame(std::chrono::milliseconds timeout)
{
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + timeout;
    RecvResult res;
    while (true) {
        // Frames left over from a previous read are served first.
        auto ex = netutil::try_extract(m_parse, res.payload);
        if (ex == netutil::extract_status::frame) {
            res.status = recv_status::frame;
            co_return res;
        }
        if (ex == netutil::extract_status::invalid) {
            log::warn("[channel] invalid frame length, closing");
            close();
            res.status = recv_status::invalid;
            co_return res;
        }
        if (!m_client) {
            res.status = recv_status::closed;
            co_return res;
        }
        auto now = clock::now();
        if (now >= deadline) {
            res.status = recv_status::timeout;
            co_return res;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (remaining.count() == 0)
            remaining = std::chrono::milliseconds(1);
        auto pstat = co_await m_client->poll(coro::poll_op::read, remaining);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat == coro::poll_status::error || pstat == coro::poll_status::closed) {
            close();
            res.status = recv_status::closed;
            co_return res;
        }
        std::string tmp(4096, '\0');
        auto [rstatus, span] = m_client->recv(tmp);
        if (rstatus == coro::net::recv_status::ok) {
            m_parse.buffer.insert(m_parse.buffer.end(), span.begin(), span.end());
        } else if (rstatus != coro::net::recv_status::would_block) {
            // closed by peer or hard error
            close();
            res.status = recv_status::closed;
            co_return res;
        }
    }
}

void TcpChannel::close()
{
    m_client.reset();
}

} // namespace arena::net
