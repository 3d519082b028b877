// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config.hpp"
#include "server/coordinator/instance_coordinator.hpp"
#include "server/engine/process_engine.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"
#include "server/results/result_aggregator.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <thread>

#ifndef ARENA_VERSION
#define ARENA_VERSION "dev"
#endif

namespace arena {
std::atomic_bool g_shutdown{false};
}

static void handle_signal(int)
{
    arena::g_shutdown.store(true);
}

static std::string runtime_json(const char *tag)
{
    auto &rt = arena::metrics::runtime();
    std::ostringstream j;
    j << "{\"metric\":\"" << tag << "\"";
    j << ",\"active_sessions\":" << rt.active_sessions.load();
    j << ",\"queued_sessions\":" << rt.queued_sessions.load();
    j << ",\"sessions_started\":" << rt.sessions_started.load();
    j << ",\"sessions_completed\":" << rt.sessions_completed.load();
    j << ",\"sessions_failed\":" << rt.sessions_failed.load();
    j << ",\"sessions_rejected\":" << rt.sessions_rejected.load();
    j << ",\"strikes_total\":" << rt.strikes_total.load();
    j << ",\"debug_frames_blocked\":" << rt.debug_frames_blocked.load();
    j << ",\"engine_crashes\":" << rt.engine_crashes.load();
    j << ",\"engine_forced_kills\":" << rt.engine_forced_kills.load();
    j << ",\"avg_step_ns\":" << arena::metrics::avg_step_ns();
    j << ",\"p99_step_ns\":" << arena::metrics::approx_step_p99();
    j << "}";
    return j.str();
}

int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    std::string engine_override;
    int duration_override_sec = 0; // 0 means run until signal
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            if (auto port = arena::parse_port(argv[++i])) {
                port_override = *port;
                cli_port_override = true;
            } else {
                arena::log::warn("Invalid --port value '{}' (expected 1..65535), ignoring", argv[i]);
            }
        } else if (a == "--engine" && i + 1 < argc) {
            engine_override = argv[++i];
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                arena::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }

    arena::ServerConfig cfg;
    try {
        cfg = arena::load_config(config_path);
        if (const char *env = std::getenv("ARENA_ENGINE"))
            cfg.engine_executable = env;
        if (!engine_override.empty())
            cfg.engine_executable = engine_override;
        if (cli_port_override)
            cfg.listen_port = port_override;
        arena::validate_config(cfg);
    } catch (const YAML::Exception &ex) {
        arena::log::error("Failed to load config {}: {}", config_path, ex.what());
        return 1;
    } catch (const std::exception &ex) {
        arena::log::error("Invalid config {}: {}", config_path, ex.what());
        return 1;
    }
    if (cfg.engine_executable.empty()) {
        arena::log::error("No engine executable configured (engine_executable, ARENA_ENGINE or --engine)");
        return 1;
    }

    // An explicit ARENA_LOG_LEVEL wins over the config file.
    if (std::getenv("ARENA_LOG_LEVEL") == nullptr)
        arena::log::set_level(arena::log::parse_level(cfg.log_level));
    if (cfg.log_json)
        arena::log::set_json(true);
    arena::log::init();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGPIPE, SIG_IGN);

    arena::log::info("arena proxy starting (version: {})", ARENA_VERSION);
    arena::log::info("Engine: {}", cfg.engine_executable);
    arena::log::info(
        "Capacity: {} parallel matches, queue {}, ports {}-{}",
        cfg.max_parallel_matches,
        cfg.queue_soft_limit,
        cfg.port_range_begin,
        cfg.port_range_end);
    if (duration_override_sec > 0)
        arena::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);

    auto scheduler = coro::default_executor::io_executor();
    arena::results::ResultAggregator aggregator{cfg.results_log};

    arena::engine::ProcessEngineOptions engine_opts;
    engine_opts.executable = cfg.engine_executable;
    engine_opts.args = cfg.engine_args;
    engine_opts.startup_timeout = std::chrono::milliseconds(cfg.engine_startup_timeout_ms);

    arena::coord::CoordinatorOptions copts;
    copts.max_parallel = cfg.max_parallel_matches;
    copts.queue_soft_limit = cfg.queue_soft_limit;
    copts.port_begin = cfg.port_range_begin;
    copts.port_end = cfg.port_range_end;
    copts.work_root = cfg.work_root;
    copts.defaults.max_game_steps = cfg.default_max_game_steps;
    copts.defaults.max_frame_time_ms = cfg.default_max_frame_time_ms;
    copts.defaults.strikes = cfg.default_strikes;
    copts.session.player_connect_timeout = std::chrono::milliseconds(cfg.player_connect_timeout_ms);
    copts.session.engine_response_timeout = std::chrono::milliseconds(cfg.engine_response_timeout_ms);
    copts.session.shutdown_grace = std::chrono::milliseconds(cfg.engine_shutdown_grace_ms);
    copts.session.real_time_step = std::chrono::milliseconds(cfg.real_time_step_ms);
    copts.session.decode_error_tolerance = cfg.decode_error_tolerance;

    arena::coord::InstanceCoordinator coordinator{
        scheduler,
        copts,
        [scheduler, engine_opts]() -> std::unique_ptr<arena::engine::Engine> {
            return std::make_unique<arena::engine::ProcessEngine>(scheduler, engine_opts);
        },
        aggregator};

    arena::net::GatewayOptions gopts;
    gopts.address = cfg.listen_address;
    gopts.port = cfg.listen_port;
    scheduler->spawn(arena::net::run_gateway(scheduler, gopts, coordinator));
    if (cfg.metrics_port != 0)
        scheduler->spawn(arena::net::run_metrics_endpoint(scheduler, cfg.metrics_port));

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!arena::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                arena::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                arena::g_shutdown.store(true);
            }
        }
        if (now - last_metrics >= std::chrono::seconds(60)) {
            last_metrics = now;
            arena::log::info("{}", runtime_json("runtime"));
        }
    }
    arena::log::info("Shutdown requested; aborting {} session(s)", coordinator.registered());
    coordinator.abort_all();
    coro::sync_wait(coordinator.drain());
    arena::log::info("{}", runtime_json("runtime_final"));
    arena::log::info("Shutdown complete.");
    arena::log::flush();
    return 0;
}
