// SPDX-License-Identifier: Apache-2.0
#include "server/game/match_result.hpp"

namespace arena::game {

const char *to_string(outcome o)
{
    switch (o) {
        case outcome::player1_win:
            return "Player1Win";
        case outcome::player2_win:
            return "Player2Win";
        case outcome::tie:
            return "Tie";
        case outcome::error:
            return "Error";
        case outcome::crash:
            return "Crash";
    }
    return "Error";
}

const char *to_string(end_reason r)
{
    switch (r) {
        case end_reason::engine_report:
            return "EngineReport";
        case end_reason::max_duration:
            return "MaxDuration";
        case end_reason::timeout_limit_exceeded:
            return "TimeoutLimitExceeded";
        case end_reason::double_timeout:
            return "DoubleTimeout";
        case end_reason::disconnect:
            return "Disconnect";
        case end_reason::engine_crash:
            return "EngineCrash";
        case end_reason::engine_launch_failed:
            return "EngineLaunchFailed";
        case end_reason::player_connect_timeout:
            return "PlayerConnectTimeout";
        case end_reason::protocol_decode_error:
            return "ProtocolDecodeError";
        case end_reason::surrender:
            return "Surrender";
        case end_reason::aborted:
            return "Aborted";
        case end_reason::internal_error:
            return "InternalError";
    }
    return "InternalError";
}

std::string MatchResult::loser() const
{
    if (!loser_slot || *loser_slot > 1)
        return {};
    return bots[*loser_slot].player_id;
}

outcome opponent_wins(uint32_t losing_slot)
{
    return losing_slot == 0 ? outcome::player2_win : outcome::player1_win;
}

arena::MatchOutcome to_proto(outcome o)
{
    switch (o) {
        case outcome::player1_win:
            return arena::MATCH_OUTCOME_PLAYER1_WIN;
        case outcome::player2_win:
            return arena::MATCH_OUTCOME_PLAYER2_WIN;
        case outcome::tie:
            return arena::MATCH_OUTCOME_TIE;
        case outcome::error:
            return arena::MATCH_OUTCOME_ERROR;
        case outcome::crash:
            return arena::MATCH_OUTCOME_CRASH;
    }
    return arena::MATCH_OUTCOME_UNSPECIFIED;
}

arena::EndReason to_proto(end_reason r)
{
    switch (r) {
        case end_reason::engine_report:
            return arena::END_REASON_ENGINE_REPORT;
        case end_reason::max_duration:
            return arena::END_REASON_MAX_DURATION;
        case end_reason::timeout_limit_exceeded:
            return arena::END_REASON_TIMEOUT_LIMIT_EXCEEDED;
        case end_reason::double_timeout:
            return arena::END_REASON_DOUBLE_TIMEOUT;
        case end_reason::disconnect:
            return arena::END_REASON_DISCONNECT;
        case end_reason::engine_crash:
            return arena::END_REASON_ENGINE_CRASH;
        case end_reason::engine_launch_failed:
            return arena::END_REASON_ENGINE_LAUNCH_FAILED;
        case end_reason::player_connect_timeout:
            return arena::END_REASON_PLAYER_CONNECT_TIMEOUT;
        case end_reason::protocol_decode_error:
            return arena::END_REASON_PROTOCOL_DECODE_ERROR;
        case end_reason::surrender:
            return arena::END_REASON_SURRENDER;
        case end_reason::aborted:
            return arena::END_REASON_ABORTED;
        case end_reason::internal_error:
            return arena::END_REASON_INTERNAL_ERROR;
    }
    return arena::END_REASON_UNSPECIFIED;
}

arena::MatchReport to_report(const MatchResult &r)
{
    arena::MatchReport rep;
    rep.set_session_id(r.session_id);
    rep.set_match_id(r.match_id);
    rep.set_outcome(to_proto(r.result));
    rep.set_reason(to_proto(r.reason));
    rep.set_loser(r.loser());
    rep.set_final_step(r.final_step);
    rep.set_elapsed_ms(static_cast<uint64_t>(r.elapsed.count()));
    rep.set_replay_path(r.replay_path);
    rep.set_game_time_seconds(r.game_time_seconds());
    for (const auto &b : r.bots) {
        auto *bs = rep.add_bots();
        bs->set_player_id(b.player_id);
        bs->set_strikes(b.strikes);
        bs->set_avg_frame_ms(b.avg_frame_ms);
        bs->set_decode_errors(b.decode_errors);
    }
    return rep;
}

} // namespace arena::game
