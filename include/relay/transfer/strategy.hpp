#pragma once

#include "relay/core/result.hpp"
#include "relay/transfer/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relay::transfer {

inline constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;
inline constexpr std::uint64_t kGiB = 1024ULL * kMiB;

/**
 * @brief Named chunk-size policy
 *
 * threshold_bytes is the largest object size this strategy is selected for,
 * chunk_size_bytes the size of every part except the last.
 */
struct ChunkStrategy {
    std::string name;
    std::uint64_t threshold_bytes = 0;
    std::uint64_t chunk_size_bytes = 0;

    bool operator==(const ChunkStrategy& other) const {
        return name == other.name && threshold_bytes == other.threshold_bytes &&
               chunk_size_bytes == other.chunk_size_bytes;
    }
    bool operator!=(const ChunkStrategy& other) const { return !(*this == other); }
};

/**
 * @brief Immutable, ascending table of chunk strategies
 *
 * Selection is a pure function of the object size. The table read backwards
 * is the fallback ladder (aggressive -> balanced -> safe -> tiny with the
 * default table).
 */
class StrategyTable {
public:
    /// tiny/safe/balanced/aggressive
    static StrategyTable defaults();

    /**
     * @brief Validate and build a table
     *
     * Rejects an empty table, zero chunk sizes, duplicate names and thresholds
     * that are not strictly ascending.
     */
    static relay::Result<StrategyTable, TransferError> create(std::vector<ChunkStrategy> strategies);

    /**
     * @brief Strategy with the smallest threshold >= size
     *
     * Falls back to the last (largest) entry when the size is above every
     * threshold. Size 0 selects the first entry.
     */
    [[nodiscard]] const ChunkStrategy& select(std::uint64_t size) const noexcept;

    /// Next entry down the ladder, nullopt at the bottom or for an unknown strategy
    [[nodiscard]] std::optional<ChunkStrategy> next_smaller(const ChunkStrategy& current) const;

    [[nodiscard]] std::optional<ChunkStrategy> find(const std::string& name) const;

    [[nodiscard]] const std::vector<ChunkStrategy>& entries() const noexcept { return strategies_; }
    [[nodiscard]] const ChunkStrategy& smallest() const noexcept { return strategies_.front(); }

private:
    explicit StrategyTable(std::vector<ChunkStrategy> strategies);

    std::vector<ChunkStrategy> strategies_;
};

} // namespace relay::transfer
