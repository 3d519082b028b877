// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <stdexcept>

namespace arena {

ServerConfig load_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    ServerConfig cfg;
    if (root["listen_address"])
        cfg.listen_address = root["listen_address"].as<std::string>();
    if (root["listen_port"])
        cfg.listen_port = root["listen_port"].as<uint16_t>();
    if (root["max_parallel_matches"])
        cfg.max_parallel_matches = root["max_parallel_matches"].as<uint32_t>();
    if (root["queue_soft_limit"])
        cfg.queue_soft_limit = root["queue_soft_limit"].as<uint32_t>();
    if (root["port_range_begin"])
        cfg.port_range_begin = root["port_range_begin"].as<uint16_t>();
    if (root["port_range_end"])
        cfg.port_range_end = root["port_range_end"].as<uint16_t>();
    if (root["engine_executable"])
        cfg.engine_executable = root["engine_executable"].as<std::string>();
    if (root["engine_args"])
        cfg.engine_args = root["engine_args"].as<std::vector<std::string>>();
    if (root["work_root"])
        cfg.work_root = root["work_root"].as<std::string>();
    if (root["engine_startup_timeout_ms"])
        cfg.engine_startup_timeout_ms = root["engine_startup_timeout_ms"].as<uint32_t>();
    if (root["engine_shutdown_grace_ms"])
        cfg.engine_shutdown_grace_ms = root["engine_shutdown_grace_ms"].as<uint32_t>();
    if (root["engine_response_timeout_ms"])
        cfg.engine_response_timeout_ms = root["engine_response_timeout_ms"].as<uint32_t>();
    if (root["results_log"])
        cfg.results_log = root["results_log"].as<std::string>();
    if (root["player_connect_timeout_ms"])
        cfg.player_connect_timeout_ms = root["player_connect_timeout_ms"].as<uint32_t>();
    if (root["real_time_step_ms"])
        cfg.real_time_step_ms = root["real_time_step_ms"].as<uint32_t>();
    if (root["default_max_game_steps"])
        cfg.default_max_game_steps = root["default_max_game_steps"].as<uint32_t>();
    if (root["default_max_frame_time_ms"])
        cfg.default_max_frame_time_ms = root["default_max_frame_time_ms"].as<uint32_t>();
    if (root["default_strikes"])
        cfg.default_strikes = root["default_strikes"].as<uint32_t>();
    if (root["decode_error_tolerance"])
        cfg.decode_error_tolerance = root["decode_error_tolerance"].as<uint32_t>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["metrics_port"])
        cfg.metrics_port = root["metrics_port"].as<uint16_t>();
    validate_config(cfg);
    return cfg;
}

void validate_config(const ServerConfig &cfg)
{
    if (cfg.max_parallel_matches == 0)
        throw std::runtime_error("max_parallel_matches must be > 0");
    if (cfg.port_range_begin == 0 || cfg.port_range_end < cfg.port_range_begin)
        throw std::runtime_error("port range is empty or starts at 0");
    if (cfg.real_time_step_ms == 0)
        throw std::runtime_error("real_time_step_ms must be > 0");
    if (cfg.default_max_game_steps == 0 || cfg.default_max_frame_time_ms == 0 || cfg.default_strikes == 0)
        throw std::runtime_error("per-match defaults must be > 0");
    if (cfg.engine_response_timeout_ms < cfg.default_max_frame_time_ms)
        throw std::runtime_error("engine_response_timeout_ms must not be shorter than default_max_frame_time_ms");
}

std::optional<uint16_t> parse_port(std::string_view text)
{
    long value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size())
        return std::nullopt;
    if (value < 1 || value > 65535)
        return std::nullopt;
    return static_cast<uint16_t>(value);
}

} // namespace arena
