// SPDX-License-Identifier: Apache-2.0
#include "server/results/result_aggregator.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace arena::results {

namespace {

std::string utc_timestamp()
{
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

// RFC 4180 quoting for fields that need it.
std::string csv_field(const std::string &v)
{
    if (v.find_first_of(",\"\n") == std::string::npos)
        return v;
    std::string out = "\"";
    for (char c : v) {
        if (c == '"')
            out += "\"\"";
        else
            out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string sanitize(const std::string &v)
{
    std::string out;
    out.reserve(v.size());
    for (char c : v)
        out.push_back((std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.') ? c : '_');
    return out;
}

} // namespace

ResultAggregator::ResultAggregator(std::filesystem::path results_log) : m_path(std::move(results_log)) {}

std::string ResultAggregator::csv_row(const game::MatchResult &r, const std::string &timestamp)
{
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(3);
    oss << timestamp << ',' << csv_field(r.match_id) << ',' << game::to_string(r.result) << ','
        << game::to_string(r.reason) << ',' << csv_field(r.loser()) << ',' << r.final_step << ','
        << r.elapsed.count() << ',' << r.bots[0].strikes << ',' << r.bots[1].strikes << ','
        << r.bots[0].avg_frame_ms << ',' << r.bots[1].avg_frame_ms << ',' << csv_field(r.replay_path);
    return oss.str();
}

std::string ResultAggregator::replay_file_name(const game::MatchResult &r)
{
    std::string id = r.match_id.empty() ? "session" + std::to_string(r.session_id) : r.match_id;
    return sanitize(id) + "_" + sanitize(r.bots[0].player_id) + "_vs_" + sanitize(r.bots[1].player_id) + ".replay";
}

std::filesystem::path ResultAggregator::replay_target(const std::string &requested, const game::MatchResult &r)
{
    std::filesystem::path p(requested);
    std::error_code ec;
    bool is_dir = (!requested.empty() && requested.back() == '/') || std::filesystem::is_directory(p, ec);
    return is_dir ? p / replay_file_name(r) : p;
}

bool ResultAggregator::write_file(const std::filesystem::path &path, const std::string &data)
{
    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
            return false;
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

bool ResultAggregator::append_row(const game::MatchResult &r)
{
    std::scoped_lock lk{m_mutex};
    std::error_code ec;
    if (m_path.has_parent_path())
        std::filesystem::create_directories(m_path.parent_path(), ec);
    bool fresh = !std::filesystem::exists(m_path, ec) || std::filesystem::file_size(m_path, ec) == 0;
    std::ofstream out(m_path, std::ios::app);
    if (!out)
        return false;
    if (fresh)
        out << csv_header << '\n';
    out << csv_row(r, utc_timestamp()) << '\n';
    out.flush();
    return static_cast<bool>(out);
}

game::MatchResult ResultAggregator::finalize(game::SessionOutcome outcome)
{
    game::MatchResult r = std::move(outcome.result);
    if (outcome.replay_data && !outcome.requested_replay.empty()) {
        auto target = replay_target(outcome.requested_replay, r);
        if (write_file(target, *outcome.replay_data)) {
            r.replay_path = target.string();
        } else {
            auto fallback = outcome.workdir / replay_file_name(r);
            log::warn("[results] replay not writable at {}, falling back to {}", target.string(), fallback.string());
            if (write_file(fallback, *outcome.replay_data))
                r.replay_path = fallback.string();
            else
                log::error("[results] replay for session {} could not be written", r.session_id);
        }
    }
    if (!append_row(r)) {
        metrics::inc(metrics::runtime().result_persist_failures);
        log::warn("[results] could not append to {}; result still delivered", m_path.string());
    }
    if (r.failed())
        metrics::inc(metrics::runtime().sessions_failed);
    else
        metrics::inc(metrics::runtime().sessions_completed);
    return r;
}

} // namespace arena::results
