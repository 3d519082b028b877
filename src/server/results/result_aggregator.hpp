// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/match_result.hpp"
#include "server/game/match_session.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace arena::results {

inline constexpr const char *csv_header = "timestamp,match_id,outcome,reason,loser,final_step,duration_ms,"
                                          "strikes_p1,strikes_p2,avg_frame_ms_p1,avg_frame_ms_p2,replay_path";

// Persists finished matches: writes the replay (if any) and appends one row
// to the results table. Persistence problems are logged and counted, never
// thrown; the finalized result is always returned.
class ResultAggregator
{
public:
    explicit ResultAggregator(std::filesystem::path results_log);

    game::MatchResult finalize(game::SessionOutcome outcome);

    // Appends one row, writing the header first when the file is new or empty.
    bool append_row(const game::MatchResult &r);

    static std::string csv_row(const game::MatchResult &r, const std::string &timestamp);
    // <match_id>_<player1>_vs_<player2>.replay
    static std::string replay_file_name(const game::MatchResult &r);
    // Requested path if it names a file, requested/<replay_file_name> if it names a directory.
    static std::filesystem::path replay_target(const std::string &requested, const game::MatchResult &r);

    const std::filesystem::path &log_path() const { return m_path; }

private:
    static bool write_file(const std::filesystem::path &path, const std::string &data);

    std::mutex m_mutex; // serialises appends from concurrent sessions
    std::filesystem::path m_path;
};

} // namespace arena::results
