// SPDX-License-Identifier: Apache-2.0
#include "server/engine/port_allocator.hpp"

#include "common/logger.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>

namespace arena::engine {

PortAllocator::PortAllocator(uint16_t begin, uint16_t end, bool probe_bind)
    : m_begin(begin), m_end(end < begin ? begin : end), m_cursor(begin), m_probe_bind(probe_bind)
{}

bool PortAllocator::bindable(uint16_t port)
{
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        return false;
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    bool ok = ::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return ok;
}

std::optional<uint16_t> PortAllocator::allocate()
{
    std::scoped_lock lk{m_mutex};
    size_t n = capacity();
    for (size_t i = 0; i < n; ++i) {
        uint16_t candidate = m_cursor;
        m_cursor = (m_cursor == m_end) ? m_begin : static_cast<uint16_t>(m_cursor + 1);
        if (m_used.count(candidate))
            continue;
        if (m_probe_bind && !bindable(candidate)) {
            log::debug("[ports] port {} busy outside the pool, skipping", candidate);
            continue;
        }
        m_used.insert(candidate);
        return candidate;
    }
    log::warn("[ports] pool exhausted range={}-{} in_use={}", m_begin, m_end, m_used.size());
    return std::nullopt;
}

void PortAllocator::release(uint16_t port)
{
    std::scoped_lock lk{m_mutex};
    if (m_used.erase(port) == 0)
        log::warn("[ports] release of unallocated port {}", port);
}

size_t PortAllocator::in_use() const
{
    std::scoped_lock lk{m_mutex};
    return m_used.size();
}

} // namespace arena::engine
