#pragma once

#include "relay/core/result.hpp"
#include "relay/transfer/errors.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace relay::transfer {

/**
 * @brief One uploaded part as recorded in the manifest
 */
struct PartDescriptor {
    std::string name;        ///< Remote object name
    std::uint64_t size = 0;  ///< Byte length
    std::uint32_t ordinal = 0;
    std::string checksum;    ///< Per-part digest (hex)
    std::uint64_t offset = 0; ///< Offset in the original object, not serialized

    bool operator==(const PartDescriptor& other) const {
        return name == other.name && size == other.size && ordinal == other.ordinal && checksum == other.checksum;
    }
};

/**
 * @brief Immutable reassembly record for a multi-part object
 *
 * Invariants (checked by ManifestBuilder::build and manifest_from_json):
 * - parts are ordered by ordinal 1..total_parts with no gaps
 * - sum(parts.size) == total_size
 */
struct Manifest {
    std::string original_name;
    std::uint32_t total_parts = 0;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;   ///< Chunk size of the strategy in effect at completion
    std::string strategy;
    std::vector<PartDescriptor> parts;
    std::string created_at;         ///< ISO-8601 UTC
    std::string owner;
    std::string digest;             ///< Whole-object checksum
    std::string reassembly;         ///< Human readable instructions
};

/// "YYYY-MM-DDTHH:MM:SSZ"
std::string iso8601_utc(std::chrono::system_clock::time_point when);

/// Remote name of a part: "<base>.part007"
std::string part_name(const std::string& base_name, std::uint32_t ordinal);

std::string manifest_name(const std::string& base_name);

std::string reassembly_instructions(const std::string& original_name, const std::vector<PartDescriptor>& parts);

/**
 * @brief Accumulates part descriptors while a transfer runs
 *
 * Parts are recorded as they complete so a failed transfer still leaves a
 * diagnostic trail of what made it to the backend. Thread safe: the
 * coordinator appends while observers may snapshot.
 */
class ManifestBuilder {
public:
    ManifestBuilder(std::string original_name, std::string owner);

    /// Append the next part; its ordinal must be exactly one past the previous part
    relay::Result<void, TransferError> add_part(PartDescriptor descriptor);

    [[nodiscard]] std::vector<PartDescriptor> parts() const;
    [[nodiscard]] std::uint64_t recorded_bytes() const;
    [[nodiscard]] std::uint32_t part_count() const;

    relay::Result<Manifest, TransferError> build(std::uint64_t total_size,
                                                 std::uint64_t chunk_size,
                                                 const std::string& strategy,
                                                 const std::string& digest,
                                                 std::chrono::system_clock::time_point created) const;

private:
    std::string original_name_;
    std::string owner_;

    mutable std::mutex mutex_;
    std::vector<PartDescriptor> parts_;
    std::uint64_t recorded_bytes_ = 0;
};

nlohmann::json manifest_to_json(const Manifest& manifest);

relay::Result<Manifest, TransferError> manifest_from_json(const nlohmann::json& document);

relay::Result<void, TransferError> write_manifest(const Manifest& manifest, const std::filesystem::path& path);

relay::Result<Manifest, TransferError> read_manifest(const std::filesystem::path& path);

/**
 * @brief Rebuild the original object from parts stored in parts_dir
 *
 * Concatenates the parts in ordinal order into output and verifies every part
 * checksum, the total size and the whole-object digest. A partially written
 * output is removed on failure.
 */
relay::Result<void, TransferError> reassemble(const Manifest& manifest,
                                              const std::filesystem::path& parts_dir,
                                              const std::filesystem::path& output);

} // namespace relay::transfer
