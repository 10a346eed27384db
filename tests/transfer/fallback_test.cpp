#include "relay/transfer/fallback.hpp"

#include <gtest/gtest.h>

#include <limits>

using relay::transfer::ErrorKind;
using relay::transfer::FallbackOrchestrator;
using relay::transfer::kMiB;
using relay::transfer::StrategyTable;

TEST(FallbackOrchestratorTest, StepsDownOneStrategyPerRejection) {
    const auto table = StrategyTable::defaults();
    FallbackOrchestrator fallback(table, table.select(3ULL * 1024 * kMiB));
    EXPECT_EQ(fallback.current().name, "aggressive");

    auto next = fallback.on_quota_rejection();
    ASSERT_TRUE(next.is_ok());
    EXPECT_EQ(next.value().name, "balanced");
    EXPECT_EQ(fallback.current().name, "balanced");
    EXPECT_EQ(fallback.fallback_count(), 1u);

    ASSERT_TRUE(fallback.on_quota_rejection().is_ok());
    ASSERT_TRUE(fallback.on_quota_rejection().is_ok());
    EXPECT_EQ(fallback.current().name, "tiny");
    EXPECT_EQ(fallback.history().size(), 4u);
}

TEST(FallbackOrchestratorTest, RejectionAtSmallestExhaustsLadder) {
    const auto table = StrategyTable::defaults();
    FallbackOrchestrator fallback(table, table.smallest());

    auto result = fallback.on_quota_rejection();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::LadderExhausted);
    EXPECT_TRUE(fallback.exhausted());
    EXPECT_EQ(fallback.current().name, "tiny");
    EXPECT_TRUE(fallback.on_quota_rejection().is_error());
}

TEST(FallbackOrchestratorTest, EffectiveChunkSizeHonoursCeiling) {
    const auto table = StrategyTable::defaults();
    FallbackOrchestrator fallback(table, table.find("safe").value());

    EXPECT_EQ(fallback.effective_chunk_size(std::numeric_limits<std::uint64_t>::max()), 90 * kMiB);
    EXPECT_EQ(fallback.effective_chunk_size(40 * kMiB), 40 * kMiB);
}
