#pragma once

#include "relay/core/result.hpp"
#include "relay/transfer/errors.hpp"
#include "relay/transfer/strategy.hpp"

#include <cstdint>
#include <vector>

namespace relay::transfer {

/**
 * @brief Walks the strategy ladder downwards on quota rejections
 *
 * Strategy_k --(quota rejection)--> Strategy_k+1 until the smallest strategy
 * is rejected, at which point the ladder is exhausted and every further call
 * fails. Parts already uploaded are never revisited; the caller resumes
 * chunking at the end of the last accepted part.
 */
class FallbackOrchestrator {
public:
    FallbackOrchestrator(const StrategyTable& table, ChunkStrategy initial);

    [[nodiscard]] const ChunkStrategy& current() const noexcept { return current_; }

    /// Advance to the next smaller strategy or fail with LadderExhausted
    relay::Result<ChunkStrategy, TransferError> on_quota_rejection();

    /// Chunk size to cut the remainder with, given the attempter's adaptive ceiling
    [[nodiscard]] std::uint64_t effective_chunk_size(std::uint64_t ceiling) const noexcept;

    [[nodiscard]] std::uint32_t fallback_count() const noexcept { return fallbacks_; }
    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }

    /// Every strategy used so far, in order
    [[nodiscard]] const std::vector<ChunkStrategy>& history() const noexcept { return history_; }

private:
    const StrategyTable& table_;
    ChunkStrategy current_;
    std::vector<ChunkStrategy> history_;
    std::uint32_t fallbacks_ = 0;
    bool exhausted_ = false;
};

} // namespace relay::transfer
