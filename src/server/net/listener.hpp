// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/coordinator/instance_coordinator.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace arena::net {

struct GatewayOptions
{
    std::string address{"127.0.0.1"};
    uint16_t port{8642};
    std::chrono::milliseconds handshake_timeout{5000};
    // Read poll timeout of supervisor connections; bounds outbound event latency.
    std::chrono::milliseconds poll_interval{50};
};

// Accept loop. Each connection sends a ClientHello first: supervisors stay
// on a request/event loop here, bots are handed to the session waiting for
// their player id.
coro::task<void> run_gateway(
    std::shared_ptr<coro::io_scheduler> scheduler, GatewayOptions options, coord::InstanceCoordinator &coordinator);

} // namespace arena::net
