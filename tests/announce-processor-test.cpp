#include "AnnounceProcessor.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace std::chrono_literals;

namespace {

constexpr uint64_t MB = 1024 * 1024;

AnnounceRequest announce(std::string hash, uint64_t downloaded, std::optional<uint64_t> left)
{
    AnnounceRequest req;
    req.info_hash = std::move(hash);
    req.downloaded = downloaded;
    req.uploaded = 0;
    req.left = left;
    return req;
}

MultiplierPolicy test_policy()
{
    MultiplierPolicy p;
    p.max_upload_multiplier = 5.0;
    p.seeding_multiplier = 2.0;
    p.ramp_up = 3600s;
    p.randomization_factor = 0.0;
    p.max_simulated_speed_mbps = 0.0;
    p.global_ratio_limit = 0.0;
    p.cooldown = 30min;
    return p;
}

} // namespace

class AnnounceProcessorTest : public ::testing::Test
{
protected:
    boost::asio::io_context ioc;
    Clock::time_point t0 = Clock::time_point{} + 200h;
};

TEST_F(AnnounceProcessorTest, rampIsAnchoredAtFirstAnnounce)
{
    AnnounceProcessor proc(ioc.get_executor(), test_policy());

    auto first = proc.process(announce("aa", 0, 1000 * MB), t0, 1.0);
    EXPECT_DOUBLE_EQ(1.0, first.multiplier);
    EXPECT_EQ(0U, first.fake_uploaded);

    auto second = proc.process(announce("aa", 100 * MB, 900 * MB), t0 + 1800s, 1.0);
    EXPECT_NEAR(3.0, second.multiplier, 1e-9);
    EXPECT_EQ(300 * MB, second.fake_uploaded);

    // a torrent seen later starts its own ramp
    auto other = proc.process(announce("bb", 100 * MB, 900 * MB), t0 + 1800s, 1.0);
    EXPECT_DOUBLE_EQ(1.0, other.multiplier);
}

TEST_F(AnnounceProcessorTest, seedingSticksOnceCompleted)
{
    AnnounceProcessor proc(ioc.get_executor(), test_policy());

    auto downloading = proc.process(announce("aa", 10 * MB, 90 * MB), t0, 1.0);
    EXPECT_FALSE(downloading.seeding);

    auto done = proc.process(announce("aa", 100 * MB, 0), t0 + 10min, 1.0);
    EXPECT_TRUE(done.seeding);
    EXPECT_TRUE(done.became_completed);
    EXPECT_DOUBLE_EQ(2.0, done.multiplier);

    auto recheck = proc.process(announce("aa", 100 * MB, 5 * MB), t0 + 20min, 1.0);
    EXPECT_TRUE(recheck.seeding);
    EXPECT_FALSE(recheck.became_completed);
    EXPECT_DOUBLE_EQ(2.0, recheck.multiplier);
}

TEST_F(AnnounceProcessorTest, missingLeftStaysNonSeeding)
{
    AnnounceProcessor proc(ioc.get_executor(), test_policy());

    auto d = proc.process(announce("aa", 100 * MB, std::nullopt), t0, 1.0);

    EXPECT_FALSE(d.seeding);
    EXPECT_FALSE(d.became_completed);
}

TEST_F(AnnounceProcessorTest, staleDownloadedUsesHighWaterMark)
{
    AnnounceProcessor proc(ioc.get_executor(), test_policy());

    proc.process(announce("aa", 100 * MB, 10), t0, 1.0);
    auto d = proc.process(announce("aa", 40 * MB, 10), t0 + 2h, 1.0);

    EXPECT_EQ(100 * MB, d.real_downloaded);
    EXPECT_EQ(500 * MB, d.fake_uploaded);
}

TEST_F(AnnounceProcessorTest, aggregatesFollowCommittedReports)
{
    AnnounceProcessor proc(ioc.get_executor(), test_policy());

    proc.process(announce("aa", 100 * MB, 10), t0, 1.0);
    proc.process(announce("bb", 50 * MB, 10), t0, 1.0);
    proc.process(announce("aa", 200 * MB, 10), t0 + 2h, 1.0);

    auto snap = proc.global().snapshot();
    EXPECT_EQ(250 * MB, snap.aggregate_real_downloaded);
    EXPECT_EQ(1000 * MB + 50 * MB, snap.aggregate_fake_uploaded);
    EXPECT_EQ(2U, proc.store().size());
}

TEST_F(AnnounceProcessorTest, cooldownLastsExactlyItsDuration)
{
    auto p = test_policy();
    p.global_ratio_limit = 2.0;
    AnnounceProcessor proc(ioc.get_executor(), p);

    proc.process(announce("aa", 100 * MB, 10), t0, 1.0);

    // full ramp would report 5x and push the ratio over 2
    auto trip = proc.process(announce("aa", 200 * MB, 10), t0 + 2h, 1.0);
    EXPECT_TRUE(trip.entered_cooldown);
    EXPECT_DOUBLE_EQ(1.0, trip.multiplier);
    EXPECT_EQ(200 * MB, trip.fake_uploaded);

    auto snap = proc.global().snapshot();
    ASSERT_TRUE(snap.cooldown_until.has_value());
    EXPECT_EQ(t0 + 2h + 30min, *snap.cooldown_until);

    auto during = proc.process(announce("aa", 210 * MB, 10), t0 + 2h + 29min, 1.0);
    EXPECT_TRUE(during.in_cooldown);
    EXPECT_FALSE(during.entered_cooldown);
    EXPECT_DOUBLE_EQ(1.0, during.multiplier);

    // a small fresh torrent does not trip the limit again
    auto after = proc.process(announce("bb", 1 * MB, 10), t0 + 2h + 30min, 1.0);
    EXPECT_TRUE(after.left_cooldown);
    EXPECT_FALSE(after.in_cooldown);
    EXPECT_FALSE(after.entered_cooldown);
    EXPECT_FALSE(proc.global().snapshot().cooldown_until.has_value());
}

TEST_F(AnnounceProcessorTest, consecutiveAnnouncesRespectSpeedCap)
{
    auto p = test_policy();
    p.ramp_up = 1s;
    p.max_simulated_speed_mbps = 80.0;   // 10'000'000 bytes/s
    AnnounceProcessor proc(ioc.get_executor(), p);

    auto previous = proc.process(announce("aa", 200'000'000, 1'000'000'000), t0 + 1s, 1.0);
    auto at = t0 + 1s;

    for (int i = 2; i <= 6; ++i) {
        at += 60s;
        auto d = proc.process(announce("aa", 200'000'000ULL * i, 1'000'000'000), at, 1.0);

        double mbps = static_cast<double>(d.fake_uploaded - previous.fake_uploaded) / 60.0 * 8.0 / 1'000'000.0;
        EXPECT_LE(mbps, 80.0 + 1e-6) << "announce " << i;
        EXPECT_TRUE(d.capped);
        EXPECT_GE(d.multiplier, 1.0);

        previous = d;
    }
}

TEST_F(AnnounceProcessorTest, asyncProcessRunsOnTorrentStrand)
{
    AnnounceProcessor proc(ioc.get_executor(), test_policy());

    std::optional<AnnounceDecision> result;
    auto req = announce("aa", 1000, 10);

    boost::asio::co_spawn(ioc, proc.async_process(req), [&](std::exception_ptr ep, AnnounceDecision d) {
        ASSERT_FALSE(ep);
        result = d;
    });

    ioc.run();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ("aa", result->info_hash);
    EXPECT_NEAR(1.0, result->multiplier, 1e-3);
    EXPECT_EQ(1000U, result->fake_uploaded);
}

TEST_F(AnnounceProcessorTest, evictedTorrentIsNotCountedTwice)
{
    AnnounceProcessor proc(ioc.get_executor(), test_policy(), 1);

    proc.process(announce("aa", 100 * MB, 10), t0, 1.0);
    proc.process(announce("bb", 50 * MB, 10), t0 + 1min, 1.0);
    auto back = proc.process(announce("aa", 200 * MB, 10), t0 + 2min, 1.0);

    // aa starts a fresh ramp, bb has been pushed out in turn
    EXPECT_DOUBLE_EQ(1.0, back.multiplier);
    EXPECT_EQ(1U, proc.store().size());

    auto snap = proc.global().snapshot();
    EXPECT_EQ(200 * MB, snap.aggregate_real_downloaded);
    EXPECT_EQ(200 * MB, snap.aggregate_fake_uploaded);
}

TEST_F(AnnounceProcessorTest, concurrentAnnouncesStayConsistent)
{
    AnnounceProcessor proc(ioc.get_executor(), test_policy());

    std::vector<AnnounceRequest> requests;
    for (uint64_t i = 1; i <= 200; ++i) requests.push_back(announce(i % 2 ? "aa" : "bb", i * MB, 10));

    std::atomic<int> done{ 0 };
    for (auto& req: requests) {
        boost::asio::co_spawn(boost::asio::make_strand(ioc), proc.async_process(req), [&](std::exception_ptr ep, AnnounceDecision) {
            EXPECT_FALSE(ep);
            ++done;
        });
    }

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) workers.emplace_back([this] { ioc.run(); });
    for (auto& w: workers) w.join();

    EXPECT_EQ(200, done.load());

    auto aa = proc.store().peek("aa");
    auto bb = proc.store().peek("bb");
    ASSERT_TRUE(aa.has_value());
    ASSERT_TRUE(bb.has_value());

    EXPECT_EQ(199 * MB, aa->real_downloaded_bytes);
    EXPECT_EQ(200 * MB, bb->real_downloaded_bytes);

    // every commit saw the previous one of its torrent, so the deltas add up exactly
    auto snap = proc.global().snapshot();
    EXPECT_EQ(399 * MB, snap.aggregate_real_downloaded);
    EXPECT_EQ(aa->last_reported_uploaded_bytes + bb->last_reported_uploaded_bytes, snap.aggregate_fake_uploaded);
}
