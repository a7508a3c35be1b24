#pragma once

#include <string>
#include <cstdint>
#include <istream>

struct ProxyConfig {
    // listener
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 3456;
    unsigned worker_threads = 0;                // 0 = hardware concurrency

    // multiplier policy
    double max_upload_multiplier = 5.0;
    double seeding_multiplier = 1.5;
    unsigned ramp_up_seconds = 3600;
    double randomization_factor = 0.05;
    double max_simulated_speed_mbps = 50.0;     // <= 0 disables the cap
    double global_ratio_limit = 3.0;            // <= 0 disables the ratio check
    unsigned cooldown_duration_minutes = 30;

    // upstream and state
    unsigned upstream_timeout_seconds = 15;
    unsigned max_tracked_torrents = 0;          // 0 = unbounded

    // logging
    std::string log_file = "newgreedy.log";
    unsigned log_retention_days = 7;
    std::string log_level = "info";

    std::string update_check_url;
};

// all keys live in the [DEFAULT] section, unknown keys are ignored
ProxyConfig parse_config(std::istream& in);
ProxyConfig load_config(const std::string& path);
void validate_config(const ProxyConfig& cfg);
