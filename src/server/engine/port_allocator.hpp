// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_set>

namespace arena::engine {

// Hands out local TCP ports from [begin, end] so that no two live engine
// processes share one. Lock is held only for the allocate/release call.
class PortAllocator
{
public:
    // probe_bind: additionally verify the port is bindable on 127.0.0.1 so
    // ports held by unrelated processes are skipped.
    PortAllocator(uint16_t begin, uint16_t end, bool probe_bind = true);

    std::optional<uint16_t> allocate();
    void release(uint16_t port);

    size_t in_use() const;
    size_t capacity() const { return static_cast<size_t>(m_end - m_begin) + 1; }

private:
    static bool bindable(uint16_t port);

    mutable std::mutex m_mutex;
    uint16_t m_begin;
    uint16_t m_end;
    uint16_t m_cursor; // next candidate, rotates so released ports cool down
    bool m_probe_bind;
    std::unordered_set<uint16_t> m_used;
};

} // namespace arena::engine
