// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/framing.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <memory>
#include <span>
#include <string>

namespace arena::net {

enum class recv_status
{
    frame,
    timeout,
    closed,
    invalid // framing violated, connection unusable
};

struct RecvResult
{
    recv_status status{recv_status::closed};
    std::string payload;
};

// Bidirectional framed message channel. One reader and one writer at a time.
class Channel
{
public:
    virtual ~Channel() = default;

    virtual coro::task<bool> send_frame(std::string payload) = 0;
    virtual coro::task<RecvResult> recv_frame(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

// Writes the whole span; false when the peer is gone.
coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data);

// Length-prefixed frames over a libcoro TCP client.
class TcpChannel final : public Channel
{
public:
    explicit TcpChannel(coro::net::tcp::client client);

    coro::task<bool> send_frame(std::string payload) override;
    coro::task<RecvResult> recv_frame(std::chrono::milliseconds timeout) override;
    void close() override;
    bool is_open() const override { return m_client != nullptr; }

private:
    std::unique_ptr<coro::net::tcp::client> m_client;
    netutil::FrameParseState m_parse;
};

} // namespace arena::net
