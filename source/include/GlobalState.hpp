#pragma once

#include <mutex>
#include <cstdint>

#include "TorrentState.hpp"

// aggregate totals and cooldown window shared by every torrent
class GlobalState {
public:
    GlobalState() = default;

    GlobalSnapshot snapshot() const;

    // deltas may be negative when a cooldown lowers the reported figure
    void add(int64_t real_delta, int64_t fake_delta);

    // drops everything a torrent has contributed, used when its state is evicted
    void forget(uint64_t real_downloaded, uint64_t fake_uploaded);

    void enter_cooldown(Clock::time_point until);
    bool in_cooldown(Clock::time_point now) const;

    // clears an elapsed cooldown, true only for the call that cleared it
    bool leave_cooldown_if_expired(Clock::time_point now);

private:
    mutable std::mutex _mutex;

    uint64_t _aggregate_real_downloaded{};
    uint64_t _aggregate_fake_uploaded{};
    std::optional<Clock::time_point> _cooldown_until;
};
