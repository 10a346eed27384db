#include "relay/transfer/fallback.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace relay::transfer {

FallbackOrchestrator::FallbackOrchestrator(const StrategyTable& table, ChunkStrategy initial)
    : table_(table), current_(std::move(initial)) {
    history_.push_back(current_);
}

relay::Result<ChunkStrategy, TransferError> FallbackOrchestrator::on_quota_rejection() {
    if (exhausted_) {
        return relay::Err<ChunkStrategy>(TransferError(ErrorKind::LadderExhausted, "strategy ladder already exhausted"));
    }

    auto next = table_.next_smaller(current_);
    if (!next) {
        exhausted_ = true;
        spdlog::error("[LadderExhausted] last_strategy={} chunk_size={}", current_.name, current_.chunk_size_bytes);
        return relay::Err<ChunkStrategy>(TransferError(
            ErrorKind::LadderExhausted,
            "backend rejected the smallest strategy '" + current_.name + "'"));
    }

    spdlog::info("[StrategyFallback] from={} to={} chunk_size={}", current_.name, next->name, next->chunk_size_bytes);
    current_ = *next;
    history_.push_back(current_);
    ++fallbacks_;
    return relay::Ok(current_);
}

std::uint64_t FallbackOrchestrator::effective_chunk_size(std::uint64_t ceiling) const noexcept {
    return std::min(current_.chunk_size_bytes, ceiling);
}

} // namespace relay::transfer
