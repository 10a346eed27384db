/**
 * @file events.hpp
 * @brief Transfer lifecycle events
 *
 * NAMING CONVENTION:
 * - Events are past-tense: TransferStartedEvent, PartUploadedEvent
 *
 * size_bucket is the name of the strategy first selected for the object
 * ("tiny", "safe", ...), or "unsized" when the transfer failed before a
 * strategy was chosen.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace relay::events {

inline constexpr const char* kUnsizedBucket = "unsized";

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief A transfer was accepted and registered for its owner
 *
 * WHO EMITS: TransferCoordinator, after the busy check
 * WHO SUBSCRIBES: logger, statistics
 */
struct TransferStartedEvent {
    std::string transfer_id;
    std::string owner_id;
    std::string object_name;
    std::string target_namespace;
    std::uint64_t expected_bytes = 0; ///< 0 when the source did not announce a size
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief The object is staged and a chunk strategy was selected
 */
struct TransferStrategizedEvent {
    std::string transfer_id;
    std::uint64_t total_bytes = 0;
    std::string strategy;
    std::uint64_t chunk_size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PartUploadedEvent {
    std::string transfer_id;
    std::string remote_name;
    std::uint32_t ordinal = 0;
    std::uint64_t bytes = 0;
    std::uint32_t attempts = 0;
    std::string strategy;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief The backend rejected a part and the ladder moved one step down
 */
struct StrategyFallbackEvent {
    std::string transfer_id;
    std::string size_bucket;
    std::string from_strategy;
    std::string to_strategy;
    std::uint64_t resume_offset = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferCompletedEvent {
    std::string transfer_id;
    std::string owner_id;
    std::string object_name;
    std::string size_bucket;
    std::string final_strategy;
    std::uint64_t total_bytes = 0;
    std::uint32_t parts = 0;
    std::uint32_t fallbacks = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferFailedEvent {
    std::string transfer_id;
    std::string owner_id;
    std::string object_name;
    std::string size_bucket;
    std::string error_kind;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace relay::events
