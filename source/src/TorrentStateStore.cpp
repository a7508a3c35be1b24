#include "TorrentStateStore.hpp"
#include "GlobalState.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace {

int64_t signed_delta(uint64_t current, uint64_t previous) {
    constexpr auto limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

    if (current >= previous) return static_cast<int64_t>(std::min(current - previous, limit));
    return -static_cast<int64_t>(std::min(previous - current, limit));
}

} // namespace

// -------------------- lease --------------------

TorrentStateStore::Lease::Lease(TorrentStateStore* store, std::string hash, std::shared_ptr<Entry> entry):
    _store(store),
    _hash(std::move(hash)),
    _entry(std::move(entry))
    {}

TorrentStateStore::Lease::Lease(Lease&& other) noexcept:
    _store(std::exchange(other._store, nullptr)),
    _hash(std::move(other._hash)),
    _entry(std::move(other._entry))
    {}

TorrentStateStore::Lease::~Lease() {
    if (_store && _entry) _store->release(*_entry);
}

TorrentStateStore::Strand TorrentStateStore::Lease::strand() const {
    return _entry->strand;
}

// -------------------- store --------------------

TorrentStateStore::TorrentStateStore(boost::asio::any_io_executor exec, GlobalState& global, size_t max_entries):
    _exec(exec),
    _global(global),
    _max_entries(max_entries)
    {}

TorrentStateStore::Lease TorrentStateStore::acquire(const std::string& hash) {
    std::lock_guard lock(_mutex);

    auto it = _entries.find(hash);
    if (it == _entries.end()) {
        auto entry = std::make_shared<Entry>(_exec);
        entry->last_touch.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed);
        it = _entries.emplace(hash, std::move(entry)).first;
    }

    auto entry = it->second;
    ++entry->pins;

    if (_max_entries > 0 && _entries.size() > _max_entries) evict_oldest(hash);

    return Lease(this, hash, std::move(entry));
}

TorrentState TorrentStateStore::record_and_get(Lease& lease, uint64_t downloaded, uint64_t uploaded, std::optional<uint64_t> left, Clock::time_point now) {
    auto& entry = *lease._entry;
    auto& state = entry.state;

    if (!entry.seen) {
        entry.seen = true;
        state.first_seen_at = now;
    }

    // a lower figure is a stale or duplicated announce, keep the high-water mark
    state.real_downloaded_bytes = std::max(state.real_downloaded_bytes, downloaded);
    state.real_uploaded_bytes = std::max(state.real_uploaded_bytes, uploaded);

    if (left && *left == 0) state.completed = true;

    entry.last_touch.store(now.time_since_epoch().count(), std::memory_order_relaxed);
    return state;
}

void TorrentStateStore::commit(Lease& lease, uint64_t fake_uploaded, Clock::time_point now) {
    auto& entry = *lease._entry;
    auto& state = entry.state;

    auto real_delta = signed_delta(state.real_downloaded_bytes, state.last_reported_downloaded_bytes);
    auto fake_delta = signed_delta(fake_uploaded, state.last_reported_uploaded_bytes);

    state.last_reported_downloaded_bytes = state.real_downloaded_bytes;
    state.last_reported_uploaded_bytes = fake_uploaded;

    if (!state.last_report_at || *state.last_report_at < now) state.last_report_at = now;

    entry.last_touch.store(state.last_report_at->time_since_epoch().count(), std::memory_order_relaxed);

    _global.add(real_delta, fake_delta);
}

std::optional<TorrentState> TorrentStateStore::peek(const Lease& lease) const {
    if (!lease._entry->seen) return std::nullopt;
    return lease._entry->state;
}

std::optional<TorrentState> TorrentStateStore::peek(const std::string& hash) const {
    std::lock_guard lock(_mutex);

    auto it = _entries.find(hash);
    if (it == _entries.end() || !it->second->seen) return std::nullopt;
    return it->second->state;
}

size_t TorrentStateStore::size() const {
    std::lock_guard lock(_mutex);
    return _entries.size();
}

void TorrentStateStore::release(Entry& entry) {
    std::lock_guard lock(_mutex);
    --entry.pins;
}

// _mutex held, linear scan is fine, it only runs when a new torrent shows up
// pinned entries are skipped, so the map may briefly hold more than _max_entries
void TorrentStateStore::evict_oldest(const std::string& keep) {
    auto victim = _entries.end();
    auto oldest = std::numeric_limits<Clock::rep>::max();

    for (auto it = _entries.begin(); it != _entries.end(); ++it) {
        if (it->first == keep || it->second->pins > 0) continue;

        auto touched = it->second->last_touch.load(std::memory_order_relaxed);
        if (touched < oldest) {
            oldest = touched;
            victim = it;
        }
    }

    if (victim == _entries.end()) return;

    // nothing is in flight for the victim, take its committed reports back out of the totals
    // so the torrent can start over from zero if it returns
    const auto& state = victim->second->state;
    _global.forget(state.last_reported_downloaded_bytes, state.last_reported_uploaded_bytes);

    proxy_logger()->debug("evicted torrent {} from the state store", victim->first);
    _entries.erase(victim);
}
