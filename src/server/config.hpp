// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arena {

struct ServerConfig
{
    // Gateway / capacity
    std::string listen_address{"127.0.0.1"};
    uint16_t listen_port{8642};
    uint32_t max_parallel_matches{2};
    uint32_t queue_soft_limit{16};
    uint16_t port_range_begin{20000};
    uint16_t port_range_end{20999};
    // Engine process
    std::string engine_executable;
    std::vector<std::string> engine_args{"-listen", "127.0.0.1", "-port", "{port}", "-tempDir", "{workdir}"};
    std::string work_root{"/tmp/arena_sessions"};
    uint32_t engine_startup_timeout_ms{60000};
    uint32_t engine_shutdown_grace_ms{3000};
    uint32_t engine_response_timeout_ms{60000};
    // Results
    std::string results_log{"results.csv"};
    // Session timing and per-match defaults (used when a request carries 0)
    uint32_t player_connect_timeout_ms{120000};
    uint32_t real_time_step_ms{45}; // ~22.4 steps per second
    uint32_t default_max_game_steps{60486};
    uint32_t default_max_frame_time_ms{1000};
    uint32_t default_strikes{10};
    uint32_t decode_error_tolerance{3};
    // Observability
    std::string log_level{"info"};
    bool log_json{false};
    uint16_t metrics_port{0}; // 0 disables
};

// Throws YAML::Exception on unreadable / malformed files and std::runtime_error
// on values that fail validation.
ServerConfig load_config(const std::string &path);

// Consistency checks shared by file loading and CLI overrides; throws std::runtime_error.
void validate_config(const ServerConfig &cfg);

// Parses a TCP port given on the command line; nullopt unless it is a whole number in 1..65535.
std::optional<uint16_t> parse_port(std::string_view text);

} // namespace arena
