#include "relay/transfer/strategy.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace relay::transfer {

StrategyTable::StrategyTable(std::vector<ChunkStrategy> strategies)
    : strategies_(std::move(strategies)) {}

StrategyTable StrategyTable::defaults() {
    return StrategyTable({
        {"tiny", 50 * kMiB, 10 * kMiB},
        {"safe", 200 * kMiB, 90 * kMiB},
        {"balanced", 1 * kGiB, 200 * kMiB},
        {"aggressive", 5 * kGiB, 500 * kMiB},
    });
}

relay::Result<StrategyTable, TransferError> StrategyTable::create(std::vector<ChunkStrategy> strategies) {
    if (strategies.empty()) {
        return relay::Err<StrategyTable>(TransferError(ErrorKind::InvalidConfig, "strategy table is empty"));
    }

    std::unordered_set<std::string> names;
    for (std::size_t i = 0; i < strategies.size(); ++i) {
        const auto& strategy = strategies[i];
        if (strategy.name.empty()) {
            return relay::Err<StrategyTable>(TransferError(ErrorKind::InvalidConfig, "strategy without a name"));
        }
        if (!names.insert(strategy.name).second) {
            return relay::Err<StrategyTable>(
                TransferError(ErrorKind::InvalidConfig, "duplicate strategy name: " + strategy.name));
        }
        if (strategy.chunk_size_bytes == 0) {
            return relay::Err<StrategyTable>(
                TransferError(ErrorKind::InvalidConfig, "chunk size must be > 0 for " + strategy.name));
        }
        if (i > 0 && strategies[i - 1].threshold_bytes >= strategy.threshold_bytes) {
            return relay::Err<StrategyTable>(
                TransferError(ErrorKind::InvalidConfig, "thresholds must be strictly ascending at " + strategy.name));
        }
        // Fallback walks towards the front, so chunks may never grow in that direction.
        if (i > 0 && strategies[i - 1].chunk_size_bytes > strategy.chunk_size_bytes) {
            return relay::Err<StrategyTable>(
                TransferError(ErrorKind::InvalidConfig, "chunk sizes must not decrease at " + strategy.name));
        }
    }
    return relay::Ok(StrategyTable(std::move(strategies)));
}

const ChunkStrategy& StrategyTable::select(std::uint64_t size) const noexcept {
    for (const auto& strategy : strategies_) {
        if (strategy.threshold_bytes >= size) {
            return strategy;
        }
    }
    return strategies_.back();
}

std::optional<ChunkStrategy> StrategyTable::next_smaller(const ChunkStrategy& current) const {
    const auto it = std::find(strategies_.begin(), strategies_.end(), current);
    if (it == strategies_.end() || it == strategies_.begin()) {
        return std::nullopt;
    }
    return *std::prev(it);
}

std::optional<ChunkStrategy> StrategyTable::find(const std::string& name) const {
    for (const auto& strategy : strategies_) {
        if (strategy.name == name) {
            return strategy;
        }
    }
    return std::nullopt;
}

} // namespace relay::transfer
