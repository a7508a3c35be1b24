#pragma once

#include <chrono>
#include <random>

#include "TorrentState.hpp"

struct ProxyConfig;

struct MultiplierPolicy {
    double max_upload_multiplier = 5.0;
    double seeding_multiplier = 1.5;
    std::chrono::seconds ramp_up{3600};
    double randomization_factor = 0.0;
    double max_simulated_speed_mbps = 0.0;      // <= 0 disables the cap
    double global_ratio_limit = 0.0;            // <= 0 disables the ratio check
    std::chrono::seconds cooldown{1800};

    static MultiplierPolicy from_config(const ProxyConfig& cfg);
};

struct MultiplierResult {
    double multiplier = 1.0;
    uint64_t fake_uploaded{};

    bool seeding = false;
    bool in_cooldown = false;
    bool entering_cooldown = false;
    bool capped = false;
};

// pure, time and randomness come in as arguments
class MultiplierEngine {
public:
    explicit MultiplierEngine(const MultiplierPolicy& policy): _policy(policy) {}

    const MultiplierPolicy& policy() const { return _policy; }

    // linear 1.0 -> max over ramp_up, flat afterwards
    double ramp(Clock::duration elapsed) const;

    // uniform in [1 - randomization_factor, 1 + randomization_factor]
    double draw_jitter(std::mt19937_64& rng) const;

    // state is the snapshot returned by record_and_get for this announce
    MultiplierResult compute(const TorrentState& state, const GlobalSnapshot& global, Clock::time_point now, double jitter) const;

private:
    MultiplierPolicy _policy;
};
