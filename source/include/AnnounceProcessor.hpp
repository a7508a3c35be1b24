#pragma once

#include <string>
#include <mutex>
#include <random>

#include <boost/asio.hpp>

#include "AnnounceRequest.hpp"
#include "GlobalState.hpp"
#include "TorrentStateStore.hpp"
#include "MultiplierEngine.hpp"

struct ProxyConfig;

struct AnnounceDecision {
    std::string info_hash;

    uint64_t real_downloaded{};
    uint64_t fake_uploaded{};
    double multiplier = 1.0;

    bool seeding = false;
    bool in_cooldown = false;
    bool capped = false;

    // state transitions caused by this announce
    bool entered_cooldown = false;
    bool left_cooldown = false;
    bool became_completed = false;
};

// store -> engine -> store, one torrent at a time
class AnnounceProcessor {
public:
    AnnounceProcessor(boost::asio::any_io_executor exec, const MultiplierPolicy& policy, size_t max_tracked_torrents = 0);

    // hops onto the torrent's strand, so announces of one hash are handled in arrival order
    [[nodiscard]] boost::asio::awaitable<AnnounceDecision> async_process(const AnnounceRequest& req);

    // synchronous variant, the caller serializes announces of one hash itself
    AnnounceDecision process(const AnnounceRequest& req, Clock::time_point now, double jitter);

    const GlobalState& global() const { return _global; }
    const TorrentStateStore& store() const { return _store; }

private:
    // runs on lease.strand()
    AnnounceDecision process(TorrentStateStore::Lease& lease, const AnnounceRequest& req, Clock::time_point now, double jitter);

    double next_jitter();
    void log_decision(const AnnounceDecision& d) const;

    GlobalState _global;
    TorrentStateStore _store;
    MultiplierEngine _engine;

    std::mutex _rng_mutex;
    std::mt19937_64 _rng{ std::random_device{}() };
};
