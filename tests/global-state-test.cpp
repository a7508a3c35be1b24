#include "GlobalState.hpp"

#include <limits>

#include "gtest/gtest.h"

using namespace std::chrono_literals;

TEST(GlobalState, aggregatesDeltas)
{
    GlobalState g;

    g.add(1000, 2500);
    g.add(500, 500);

    auto snap = g.snapshot();
    EXPECT_EQ(1500U, snap.aggregate_real_downloaded);
    EXPECT_EQ(3000U, snap.aggregate_fake_uploaded);
    EXPECT_DOUBLE_EQ(2.0, snap.ratio());
}

TEST(GlobalState, negativeDeltasNeverUnderflow)
{
    GlobalState g;

    g.add(100, 100);
    g.add(0, -40);
    EXPECT_EQ(60U, g.snapshot().aggregate_fake_uploaded);

    g.add(0, -1000);
    EXPECT_EQ(0U, g.snapshot().aggregate_fake_uploaded);
}

TEST(GlobalState, ratioWithoutDownloadsIsZero)
{
    GlobalState g;
    g.add(0, 12345);

    EXPECT_DOUBLE_EQ(0.0, g.snapshot().ratio());
}

TEST(GlobalState, cooldownWindow)
{
    GlobalState g;
    auto t0 = Clock::time_point{} + 1h;

    EXPECT_FALSE(g.in_cooldown(t0));
    EXPECT_FALSE(g.leave_cooldown_if_expired(t0));

    g.enter_cooldown(t0 + 30min);
    EXPECT_TRUE(g.in_cooldown(t0));
    EXPECT_TRUE(g.in_cooldown(t0 + 30min - 1s));
    EXPECT_FALSE(g.in_cooldown(t0 + 30min));

    EXPECT_FALSE(g.leave_cooldown_if_expired(t0 + 10min));

    // reported exactly once
    EXPECT_TRUE(g.leave_cooldown_if_expired(t0 + 30min));
    EXPECT_FALSE(g.leave_cooldown_if_expired(t0 + 31min));
    EXPECT_FALSE(g.snapshot().cooldown_until.has_value());
}

TEST(GlobalState, racingCooldownsKeepLaterDeadline)
{
    GlobalState g;
    auto t0 = Clock::time_point{} + 1h;

    g.enter_cooldown(t0 + 30min);
    g.enter_cooldown(t0 + 20min);

    ASSERT_TRUE(g.snapshot().cooldown_until.has_value());
    EXPECT_EQ(t0 + 30min, *g.snapshot().cooldown_until);
}

TEST(GlobalState, forgetRemovesContribution)
{
    GlobalState g;

    g.add(300, 900);
    g.forget(100, 500);

    auto snap = g.snapshot();
    EXPECT_EQ(200U, snap.aggregate_real_downloaded);
    EXPECT_EQ(400U, snap.aggregate_fake_uploaded);

    g.forget(1000, 1000);
    EXPECT_EQ(0U, g.snapshot().aggregate_real_downloaded);
    EXPECT_EQ(0U, g.snapshot().aggregate_fake_uploaded);
}

TEST(GlobalState, positiveDeltasSaturate)
{
    GlobalState g;

    g.add(0, std::numeric_limits<int64_t>::max());
    g.add(0, std::numeric_limits<int64_t>::max());
    g.add(0, std::numeric_limits<int64_t>::max());

    EXPECT_EQ(std::numeric_limits<uint64_t>::max(), g.snapshot().aggregate_fake_uploaded);
}
