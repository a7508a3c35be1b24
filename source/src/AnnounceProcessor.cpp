#include "AnnounceProcessor.hpp"
#include "Logging.hpp"
#include "Utils.hpp"

AnnounceProcessor::AnnounceProcessor(boost::asio::any_io_executor exec, const MultiplierPolicy& policy, size_t max_tracked_torrents):
    _store(exec, _global, max_tracked_torrents),
    _engine(policy)
    {}

boost::asio::awaitable<AnnounceDecision> AnnounceProcessor::async_process(const AnnounceRequest& req) {
    // the lease keeps the entry, and with it the strand, alive until the decision is back
    auto lease = _store.acquire(req.info_hash);
    auto jitter = next_jitter();

    // the clock is read on the strand so last_report_at never goes backwards
    co_return co_await boost::asio::co_spawn(
        lease.strand(),
        [this, &lease, &req, jitter]() -> boost::asio::awaitable<AnnounceDecision> {
            co_return process(lease, req, Clock::now(), jitter);
        },
        boost::asio::use_awaitable
    );
}

AnnounceDecision AnnounceProcessor::process(const AnnounceRequest& req, Clock::time_point now, double jitter) {
    auto lease = _store.acquire(req.info_hash);
    return process(lease, req, now, jitter);
}

AnnounceDecision AnnounceProcessor::process(TorrentStateStore::Lease& lease, const AnnounceRequest& req, Clock::time_point now, double jitter) {
    AnnounceDecision d;
    d.info_hash = req.info_hash;

    d.left_cooldown = _global.leave_cooldown_if_expired(now);

    auto previous = _store.peek(lease);
    auto state = _store.record_and_get(lease, req.downloaded, req.uploaded, req.left, now);
    d.became_completed = state.completed && !(previous && previous->completed);

    auto result = _engine.compute(state, _global.snapshot(), now, jitter);
    if (result.entering_cooldown) _global.enter_cooldown(now + _engine.policy().cooldown);

    _store.commit(lease, result.fake_uploaded, now);

    d.real_downloaded = state.real_downloaded_bytes;
    d.fake_uploaded = result.fake_uploaded;
    d.multiplier = result.multiplier;
    d.seeding = result.seeding;
    d.in_cooldown = result.in_cooldown;
    d.capped = result.capped;
    d.entered_cooldown = result.entering_cooldown;

    log_decision(d);
    return d;
}

double AnnounceProcessor::next_jitter() {
    std::lock_guard lock(_rng_mutex);
    return _engine.draw_jitter(_rng);
}

void AnnounceProcessor::log_decision(const AnnounceDecision& d) const {
    auto logger = proxy_logger();

    if (d.left_cooldown) logger->warn("cooldown over, boosting resumes");

    if (d.became_completed) logger->warn("torrent {} completed, switching to seeding multiplier", d.info_hash);

    if (d.entered_cooldown) {
        auto snap = _global.snapshot();
        logger->warn("global ratio limit reached (ratio {:.3f}), cooldown for {} min",
            snap.ratio(),
            std::chrono::duration_cast<std::chrono::minutes>(_engine.policy().cooldown).count());
    }

    logger->info("announce hash={} downloaded={:.2f}MB reported={:.2f}MB multiplier={:.3f} seeding={} cooldown={} capped={}",
        d.info_hash,
        bytes_to_mb(d.real_downloaded),
        bytes_to_mb(d.fake_uploaded),
        d.multiplier,
        d.seeding,
        d.in_cooldown,
        d.capped);
}
