#include "MultiplierEngine.hpp"
#include "ProxyConfig.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {

// Mbit/s to bytes/s
constexpr double BYTES_PER_MEGABIT = 1'000'000.0 / 8.0;

// saturates, downloaded comes straight from the client and times a multiplier can leave the u64 range
uint64_t to_bytes(double value) {
    constexpr auto max_bytes = std::numeric_limits<uint64_t>::max();

    if (!(value > 0.0)) return 0;
    if (value >= static_cast<double>(max_bytes)) return max_bytes;
    return static_cast<uint64_t>(std::floor(value));
}

} // namespace

MultiplierPolicy MultiplierPolicy::from_config(const ProxyConfig& cfg) {
    MultiplierPolicy p;

    p.max_upload_multiplier = cfg.max_upload_multiplier;
    p.seeding_multiplier = cfg.seeding_multiplier;
    p.ramp_up = std::chrono::seconds(cfg.ramp_up_seconds);
    p.randomization_factor = cfg.randomization_factor;
    p.max_simulated_speed_mbps = cfg.max_simulated_speed_mbps;
    p.global_ratio_limit = cfg.global_ratio_limit;
    p.cooldown = std::chrono::minutes(cfg.cooldown_duration_minutes);

    return p;
}

double MultiplierEngine::ramp(Clock::duration elapsed) const {
    if (_policy.ramp_up.count() <= 0) return _policy.max_upload_multiplier;

    auto seconds = std::chrono::duration<double>(elapsed).count();
    auto progress = std::clamp(seconds / static_cast<double>(_policy.ramp_up.count()), 0.0, 1.0);

    return 1.0 + (_policy.max_upload_multiplier - 1.0) * progress;
}

double MultiplierEngine::draw_jitter(std::mt19937_64& rng) const {
    if (_policy.randomization_factor <= 0.0) return 1.0;

    std::uniform_real_distribution<double> dist(1.0 - _policy.randomization_factor, 1.0 + _policy.randomization_factor);
    return dist(rng);
}

MultiplierResult MultiplierEngine::compute(const TorrentState& state, const GlobalSnapshot& global, Clock::time_point now, double jitter) const {
    MultiplierResult out;
    out.seeding = state.completed;

    const auto downloaded = state.real_downloaded_bytes;
    const auto downloaded_d = static_cast<double>(downloaded);

    auto straight = [&](MultiplierResult& r) {
        r.multiplier = 1.0;
        r.fake_uploaded = downloaded;
        return r;
    };

    // 1. cooldown wins over everything
    if (global.cooldown_until && now < *global.cooldown_until) {
        out.in_cooldown = true;
        return straight(out);
    }

    // 3. + 4. base multiplier with per-request jitter
    double base = state.completed ? _policy.seeding_multiplier : ramp(now - state.first_seen_at);
    double multiplier = base * jitter;
    double candidate = downloaded_d * multiplier;

    out.multiplier = multiplier;
    out.fake_uploaded = to_bytes(candidate);

    // 5. speed cap, needs a previous report to measure a rate against
    if (_policy.max_simulated_speed_mbps > 0.0 && state.last_report_at && downloaded > 0) {
        double elapsed = std::max(0.0, std::chrono::duration<double>(now - *state.last_report_at).count());
        double allowed = _policy.max_simulated_speed_mbps * BYTES_PER_MEGABIT * elapsed;
        double previous = static_cast<double>(state.last_reported_uploaded_bytes);

        if (candidate - previous > allowed) {
            double clamped = previous + allowed;
            out.capped = true;

            // never below a straight 1:1 report
            if (clamped <= downloaded_d) {
                out.multiplier = 1.0;
                out.fake_uploaded = downloaded;
            }
            else {
                out.multiplier = clamped / downloaded_d;
                out.fake_uploaded = to_bytes(clamped);
            }
        }
    }

    // 2. ratio check, against the current totals and against the totals the capped report would produce
    if (_policy.global_ratio_limit > 0.0) {
        double real_delta = downloaded_d - static_cast<double>(state.last_reported_downloaded_bytes);
        double fake_delta = static_cast<double>(out.fake_uploaded) - static_cast<double>(state.last_reported_uploaded_bytes);

        double real_total = static_cast<double>(global.aggregate_real_downloaded) + real_delta;
        double fake_total = static_cast<double>(global.aggregate_fake_uploaded) + fake_delta;
        double prospective = real_total > 0.0 ? fake_total / real_total : 0.0;

        if (global.ratio() >= _policy.global_ratio_limit || prospective >= _policy.global_ratio_limit) {
            out.in_cooldown = true;
            out.entering_cooldown = true;
            out.capped = false;
            return straight(out);
        }
    }

    return out;
}
