// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "arena.pb.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace arena::game {

// Server-side values substituted for zero fields of a start request.
struct MatchDefaults
{
    uint32_t max_game_steps{60486};
    uint32_t max_frame_time_ms{1000};
    uint32_t strikes{10};
};

// Immutable per-match configuration resolved from a supervisor request.
struct MatchConfig
{
    std::string map;
    uint32_t max_game_steps{0};
    std::array<std::string, 2> players;
    std::string replay_path;
    std::string match_id;
    bool disable_debug{false};
    std::chrono::milliseconds max_frame_time{0};
    uint32_t strikes{0};
    bool real_time{false};
    bool visualize{false}; // accepted, no effect

    // Slot (0/1) configured for player_id, nullopt when not part of this match.
    std::optional<uint32_t> slot_of(std::string_view player_id) const;
};

// Error text when the request cannot form a match, nullopt when valid.
std::optional<std::string> validate(const arena::StartMatch &req);

MatchConfig resolve(const arena::StartMatch &req, const MatchDefaults &defaults);

} // namespace arena::game
