#include "GlobalState.hpp"

#include <algorithm>
#include <limits>

namespace {

// clamps at both ends of the u64 range
uint64_t apply_delta(uint64_t total, int64_t delta) {
    if (delta >= 0) {
        auto grow = static_cast<uint64_t>(delta);
        return grow > std::numeric_limits<uint64_t>::max() - total ? std::numeric_limits<uint64_t>::max() : total + grow;
    }

    auto magnitude = static_cast<uint64_t>(-(delta + 1)) + 1;
    return magnitude > total ? 0 : total - magnitude;
}

} // namespace

GlobalSnapshot GlobalState::snapshot() const {
    std::lock_guard lock(_mutex);
    return { _aggregate_real_downloaded, _aggregate_fake_uploaded, _cooldown_until };
}

void GlobalState::add(int64_t real_delta, int64_t fake_delta) {
    std::lock_guard lock(_mutex);
    _aggregate_real_downloaded = apply_delta(_aggregate_real_downloaded, real_delta);
    _aggregate_fake_uploaded = apply_delta(_aggregate_fake_uploaded, fake_delta);
}

void GlobalState::forget(uint64_t real_downloaded, uint64_t fake_uploaded) {
    std::lock_guard lock(_mutex);
    _aggregate_real_downloaded -= std::min(real_downloaded, _aggregate_real_downloaded);
    _aggregate_fake_uploaded -= std::min(fake_uploaded, _aggregate_fake_uploaded);
}

void GlobalState::enter_cooldown(Clock::time_point until) {
    std::lock_guard lock(_mutex);

    // two racing requests may both trip the limit, keep the later deadline
    if (!_cooldown_until || *_cooldown_until < until) _cooldown_until = until;
}

bool GlobalState::in_cooldown(Clock::time_point now) const {
    std::lock_guard lock(_mutex);
    return _cooldown_until && now < *_cooldown_until;
}

bool GlobalState::leave_cooldown_if_expired(Clock::time_point now) {
    std::lock_guard lock(_mutex);

    if (!_cooldown_until || now < *_cooldown_until) return false;

    _cooldown_until.reset();
    return true;
}
