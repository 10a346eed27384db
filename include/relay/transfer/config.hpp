#pragma once

#include "relay/core/result.hpp"
#include "relay/transfer/errors.hpp"
#include "relay/transfer/strategy.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace relay::transfer {

/**
 * @brief Engine tunables
 *
 * Every field has a working default; a JSON file only needs the keys it
 * overrides. Example:
 *
 * {
 *   "staging_root": "/var/tmp/relay",
 *   "max_attempts": 3,
 *   "base_delay_ms": 2000,
 *   "strategies": [{"name": "tiny", "threshold": 52428800, "chunk_size": 10485760}]
 * }
 */
struct EngineConfig {
    std::filesystem::path staging_root = std::filesystem::temp_directory_path() / "relay-staging";
    std::uint64_t max_object_bytes = 50 * kGiB;     ///< Hard ceiling, larger objects are refused
    std::uint32_t max_attempts = 3;                 ///< Upload tries per part (first try included)
    std::chrono::milliseconds base_delay{2000};     ///< Linear backoff unit
    double shrink_factor = 0.8;                     ///< Adaptive ceiling shrink on quota rejection
    std::uint64_t min_chunk_bytes = 1 * kMiB;       ///< Adaptive ceiling floor
    std::chrono::milliseconds progress_interval{2000};
    std::vector<std::string> quota_markers = default_quota_markers();
    std::string log_level = "info";
    StrategyTable strategies = StrategyTable::defaults();
};

relay::Result<EngineConfig, TransferError> config_from_json(const nlohmann::json& document);

relay::Result<EngineConfig, TransferError> load_config(const std::filesystem::path& path);

nlohmann::json config_to_json(const EngineConfig& config);

} // namespace relay::transfer
