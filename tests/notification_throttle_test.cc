#include <chrono>
#include <core/transfer/notification_throttle.h>
#include <gtest/gtest.h>
#include <vector>

using namespace fileferry::core;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

namespace {

const Clock::time_point kStart = Clock::time_point{} + 1h;

ProgressSnapshot At(std::uint64_t bytes, std::uint64_t total = 1000) {
    ProgressSnapshot snapshot;
    snapshot.current_bytes = bytes;
    snapshot.total_bytes = total;
    snapshot.percentage = 100.0 * bytes / total;
    return snapshot;
}

} // namespace

TEST(NotificationThrottleTest, FirstSnapshotIsEmitted) {
    NotificationThrottle throttle;
    EXPECT_EQ(throttle.Offer(At(10), false, kStart), ThrottleDecision::kEmit);
    EXPECT_FALSE(throttle.pending().has_value());
}

TEST(NotificationThrottleTest, SuppressedSnapshotsKeepOnlyTheFreshest) {
    NotificationThrottle throttle(2s);
    ASSERT_EQ(throttle.Offer(At(10), false, kStart), ThrottleDecision::kEmit);
    throttle.MarkEmitted(kStart);

    EXPECT_EQ(throttle.Offer(At(20), false, kStart + 1s), ThrottleDecision::kSuppress);
    ASSERT_TRUE(throttle.pending().has_value());
    EXPECT_EQ(throttle.pending()->current_bytes, 20u);

    EXPECT_EQ(throttle.Offer(At(30), false, kStart + 1500ms), ThrottleDecision::kSuppress);
    EXPECT_EQ(throttle.pending()->current_bytes, 30u);

    EXPECT_EQ(throttle.Offer(At(40), false, kStart + 2s), ThrottleDecision::kEmit);
    EXPECT_FALSE(throttle.pending().has_value());
}

TEST(NotificationThrottleTest, FinalSnapshotIgnoresTheInterval) {
    NotificationThrottle throttle(2s);
    throttle.Offer(At(10), false, kStart);
    throttle.MarkEmitted(kStart);

    EXPECT_EQ(throttle.Offer(At(500), false, kStart + 10ms), ThrottleDecision::kSuppress);
    EXPECT_EQ(throttle.Offer(At(1000), true, kStart + 20ms), ThrottleDecision::kEmit);
    EXPECT_FALSE(throttle.pending().has_value());
}

TEST(NotificationThrottleTest, AtMostOneEmissionPerInterval) {
    NotificationThrottle throttle(2s);

    std::vector<Clock::time_point> emitted;
    for (int i = 0; i < 200; ++i) {
        auto now = kStart + i * 100ms;
        bool is_final = i == 199;
        if (throttle.Offer(At(i * 5, 1000), is_final, now) == ThrottleDecision::kEmit) {
            throttle.MarkEmitted(now);
            emitted.push_back(now);
        }
    }

    ASSERT_GE(emitted.size(), 2u);
    EXPECT_EQ(emitted.back(), kStart + 199 * 100ms);
    // every gap except the one before the final emission honours the interval
    for (std::size_t i = 1; i + 1 < emitted.size(); ++i) {
        EXPECT_GE(emitted[i] - emitted[i - 1], 2s);
    }
    EXPECT_EQ(emitted.size(), 11u);
}

TEST(NotificationThrottleTest, RetainAndTakePending) {
    NotificationThrottle throttle;
    EXPECT_FALSE(throttle.TakePending().has_value());

    throttle.Retain(At(100));
    throttle.Retain(At(200));
    auto pending = throttle.TakePending();
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(pending->current_bytes, 200u);
    EXPECT_FALSE(throttle.pending().has_value());
}

TEST(NotificationThrottleTest, MarkEmittedRestartsTheInterval) {
    NotificationThrottle throttle(2s);
    EXPECT_FALSE(throttle.last_emit_time().has_value());

    throttle.MarkEmitted(kStart + 5s);
    EXPECT_EQ(throttle.last_emit_time(), kStart + 5s);
    EXPECT_EQ(throttle.Offer(At(10), false, kStart + 6s), ThrottleDecision::kSuppress);
    EXPECT_EQ(throttle.Offer(At(20), false, kStart + 7s), ThrottleDecision::kEmit);
}
