// SPDX-License-Identifier: Apache-2.0
#include "server/game/match_config.hpp"

namespace arena::game {

std::optional<uint32_t> MatchConfig::slot_of(std::string_view player_id) const
{
    for (uint32_t i = 0; i < players.size(); ++i) {
        if (players[i] == player_id)
            return i;
    }
    return std::nullopt;
}

std::optional<std::string> validate(const arena::StartMatch &req)
{
    if (req.player1().empty() || req.player2().empty())
        return std::string("both player identifiers are required");
    if (req.player1() == req.player2())
        return std::string("player identifiers must differ");
    if (req.map().empty())
        return std::string("map is required");
    return std::nullopt;
}

MatchConfig resolve(const arena::StartMatch &req, const MatchDefaults &defaults)
{
    MatchConfig cfg;
    cfg.map = req.map();
    cfg.max_game_steps = req.max_game_steps() ? req.max_game_steps() : defaults.max_game_steps;
    cfg.players = {req.player1(), req.player2()};
    cfg.replay_path = req.replay_path();
    cfg.match_id = req.match_id();
    cfg.disable_debug = req.disable_debug();
    cfg.max_frame_time =
        std::chrono::milliseconds(req.max_frame_time_ms() ? req.max_frame_time_ms() : defaults.max_frame_time_ms);
    cfg.strikes = req.strikes() ? req.strikes() : defaults.strikes;
    cfg.real_time = req.real_time();
    cfg.visualize = req.visualize();
    return cfg;
}

} // namespace arena::game
