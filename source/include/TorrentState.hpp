#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

using Clock = std::chrono::steady_clock;

struct TorrentState {
    // last values the client reported, never decrease
    uint64_t real_downloaded_bytes{};
    uint64_t real_uploaded_bytes{};

    Clock::time_point first_seen_at{};
    bool completed = false;

    // what we told the tracker last time
    uint64_t last_reported_uploaded_bytes{};
    uint64_t last_reported_downloaded_bytes{};
    std::optional<Clock::time_point> last_report_at;
};

struct GlobalSnapshot {
    uint64_t aggregate_real_downloaded{};
    uint64_t aggregate_fake_uploaded{};
    std::optional<Clock::time_point> cooldown_until;

    double ratio() const {
        return aggregate_real_downloaded == 0 ? 0.0 : static_cast<double>(aggregate_fake_uploaded) / static_cast<double>(aggregate_real_downloaded);
    }
};
