// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "arena.pb.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace arena::game {

enum class outcome
{
    player1_win,
    player2_win,
    tie,
    error,
    crash
};

enum class end_reason
{
    engine_report,
    max_duration,
    timeout_limit_exceeded,
    double_timeout,
    disconnect,
    engine_crash,
    engine_launch_failed,
    player_connect_timeout,
    protocol_decode_error,
    surrender,
    aborted,
    internal_error
};

const char *to_string(outcome o);
const char *to_string(end_reason r);

// Steps per simulated second of the engine's clock.
inline constexpr double steps_per_second = 22.4;

struct BotStats
{
    std::string player_id;
    uint32_t strikes{0};
    double avg_frame_ms{0.0};
    uint32_t decode_errors{0};
};

struct MatchResult
{
    uint64_t session_id{0};
    std::string match_id;
    outcome result{outcome::error};
    end_reason reason{end_reason::internal_error};
    std::optional<uint32_t> loser_slot; // losing / erroring bot when applicable
    uint32_t final_step{0};
    std::chrono::milliseconds elapsed{0};
    std::string replay_path; // actually written, empty when none
    std::array<BotStats, 2> bots;

    std::string loser() const;
    double game_time_seconds() const { return static_cast<double>(final_step) / steps_per_second; }
    bool failed() const { return result == outcome::error || result == outcome::crash; }
};

// Winner outcome when slot forfeits.
outcome opponent_wins(uint32_t losing_slot);

arena::MatchReport to_report(const MatchResult &r);
arena::MatchOutcome to_proto(outcome o);
arena::EndReason to_proto(end_reason r);

} // namespace arena::game
