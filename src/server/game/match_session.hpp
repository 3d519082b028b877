// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/engine/engine.hpp"
#include "server/game/match_config.hpp"
#include "server/game/match_result.hpp"
#include "server/game/step_scheduler.hpp"
#include "server/net/channel.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace arena::game {

enum class session_state
{
    idle,
    awaiting_players,
    launching,
    in_progress,
    ending,
    closed,
    failed
};

const char *to_string(session_state s);

// Admission control the session waits on before launching its engine.
class AdmissionGate
{
public:
    virtual ~AdmissionGate() = default;
    // Resolves true once admitted; false when abort was raised while queued.
    virtual coro::task<bool> acquire(uint64_t session_id, const std::atomic<bool> &abort) = 0;
    virtual void release(uint64_t session_id) = 0;
};

struct SessionOptions
{
    std::chrono::milliseconds player_connect_timeout{120000};
    std::chrono::milliseconds engine_response_timeout{60000};
    std::chrono::milliseconds shutdown_grace{3000};
    std::chrono::milliseconds real_time_step{45};
    uint32_t decode_error_tolerance{3};
    std::filesystem::path workdir;
    uint16_t port{0};
};

// What a finished session hands to the result aggregator.
struct SessionOutcome
{
    MatchResult result;
    std::optional<std::string> replay_data; // engine replay bytes when requested and produced
    std::string requested_replay; // as given in the start request
    std::filesystem::path workdir; // fallback location for the replay
};

enum class attach_status
{
    attached,
    unknown_player,
    slot_taken,
    not_accepting
};

// One match: players attach, the engine is launched, the step scheduler runs
// the game and the session produces exactly one result. Bot channels and the
// engine are owned here and released on every exit path.
class MatchSession : public std::enable_shared_from_this<MatchSession>
{
public:
    MatchSession(
        uint64_t id,
        MatchConfig config,
        SessionOptions options,
        std::shared_ptr<coro::io_scheduler> scheduler,
        std::unique_ptr<engine::Engine> engine);

    uint64_t id() const { return m_id; }
    const MatchConfig &config() const { return m_config; }
    session_state state() const { return m_state.load(std::memory_order_acquire); }

    // Matches a bot to its configured slot. The channel is moved only on success.
    attach_status attach(const std::string &player_id, std::unique_ptr<net::Channel> &channel, uint32_t &slot);
    // True when player_id names an unfilled slot and players are still accepted.
    bool awaits(const std::string &player_id) const;

    void request_abort() { m_abort.store(true, std::memory_order_release); }
    bool abort_requested() const { return m_abort.load(std::memory_order_acquire); }

    // Runs the whole lifecycle. gate may be null (admitted immediately).
    coro::task<SessionOutcome> run(AdmissionGate *gate);

private:
    coro::task<std::optional<Verdict>> await_players();
    coro::task<std::optional<Verdict>> launch();
    coro::task<std::optional<arena::Response>> engine_call(uint32_t slot, const arena::Request &req);
    coro::task<Verdict> play();
    coro::task<std::optional<std::string>> fetch_replay();
    coro::task<void> shutdown_engine();
    void set_state(session_state s);
    void finish(const Verdict &v);

    uint64_t m_id;
    MatchConfig m_config;
    SessionOptions m_options;
    std::shared_ptr<coro::io_scheduler> m_scheduler;
    std::unique_ptr<engine::Engine> m_engine;
    std::atomic<session_state> m_state{session_state::idle};
    std::atomic<bool> m_abort{false};
    mutable std::mutex m_mutex; // guards m_bots during attach
    std::array<std::unique_ptr<net::Channel>, 2> m_bots;
    std::array<std::unique_ptr<ProtocolBridge>, 2> m_bridges; // outlive m_steps, which points at them
    std::unique_ptr<StepScheduler> m_steps;
    std::chrono::steady_clock::time_point m_started{};
    bool m_engine_started{false};
    std::optional<MatchResult> m_result; // set exactly once by finish()
};

} // namespace arena::game
