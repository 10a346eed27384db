#include "relay/events/components.hpp"
#include "relay/events/event_bus.hpp"
#include "relay/events/events.hpp"

#include <gtest/gtest.h>

using namespace relay::events;

TEST(TransferStatsComponentTest, CountsOutcomesPerBucket) {
    EventBus bus;
    TransferStatsComponent stats(bus);

    bus.emit(TransferStartedEvent{"t-1", "a", "x.bin", "ns", 100});
    bus.emit(TransferStartedEvent{"t-2", "b", "y.bin", "ns", 0});
    bus.emit(TransferStartedEvent{"t-3", "c", "z.bin", "ns", 0});

    TransferCompletedEvent done;
    done.size_bucket = "balanced";
    done.total_bytes = 300;
    bus.emit(done);

    TransferFailedEvent failed;
    failed.size_bucket = "balanced";
    bus.emit(failed);

    TransferFailedEvent early;
    early.size_bucket = kUnsizedBucket;
    bus.emit(early);

    EXPECT_EQ(stats.started(), 3u);

    const auto balanced = stats.bucket("balanced");
    EXPECT_EQ(balanced.completed, 1u);
    EXPECT_EQ(balanced.failed, 1u);
    EXPECT_EQ(balanced.bytes, 300u);
    EXPECT_DOUBLE_EQ(balanced.success_rate(), 0.5);

    EXPECT_EQ(stats.bucket(kUnsizedBucket).failed, 1u);
}

TEST(TransferStatsComponentTest, FallbacksAreAttributedToInitialBucket) {
    EventBus bus;
    TransferStatsComponent stats(bus);

    bus.emit(StrategyFallbackEvent{"t-1", "aggressive", "aggressive", "balanced", 0});
    bus.emit(StrategyFallbackEvent{"t-1", "aggressive", "balanced", "safe", 400});

    EXPECT_EQ(stats.bucket("aggressive").fallbacks, 2u);
    EXPECT_EQ(stats.bucket("balanced").fallbacks, 0u);
}

TEST(TransferStatsComponentTest, UnknownBucketIsZero) {
    EventBus bus;
    TransferStatsComponent stats(bus);

    const auto empty = stats.bucket("tiny");
    EXPECT_EQ(empty.completed, 0u);
    EXPECT_DOUBLE_EQ(empty.success_rate(), 0.0);
    EXPECT_TRUE(stats.buckets().empty());
}

TEST(TransferStatsComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        TransferStatsComponent stats(bus);
        TransferLoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<TransferCompletedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<TransferCompletedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<TransferStartedEvent>(), 0u);
}
