#pragma once

#include "relay/core/result.hpp"
#include "relay/transfer/errors.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace relay::transfer {

/**
 * @brief One part materialized in transient local storage
 *
 * Owns its staging file: the file is deleted when the part is destroyed or
 * release() is called, whichever comes first. Move-only.
 */
class StagedPart {
public:
    StagedPart(std::filesystem::path path,
               std::uint32_t ordinal,
               std::uint64_t offset,
               std::uint64_t length,
               std::string checksum);
    ~StagedPart();

    StagedPart(const StagedPart&) = delete;
    StagedPart& operator=(const StagedPart&) = delete;
    StagedPart(StagedPart&& other) noexcept;
    StagedPart& operator=(StagedPart&& other) noexcept;

    [[nodiscard]] std::uint32_t ordinal() const noexcept { return ordinal_; }
    [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::uint64_t length() const noexcept { return length_; }
    [[nodiscard]] const std::string& checksum() const noexcept { return checksum_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    relay::Result<std::vector<char>, TransferError> read_bytes() const;

    /// Delete the staging file now
    void release() noexcept;

private:
    std::filesystem::path path_;
    std::uint32_t ordinal_ = 0;
    std::uint64_t offset_ = 0;
    std::uint64_t length_ = 0;
    std::string checksum_;
};

/**
 * @brief Splits a byte stream into bounded parts
 *
 * Every part is exactly chunk_size bytes except the last one, which holds the
 * remainder. A stream ending on a chunk boundary produces no trailing empty
 * part; a stream that is empty from the start produces one zero-length part.
 *
 * The sequence is lazy and not restartable: to re-chunk a remainder with a
 * different size, position the stream and build a new writer with the next
 * ordinal and the resume offset.
 */
class ChunkWriter {
public:
    ChunkWriter(std::istream& input,
                std::uint64_t chunk_size,
                std::filesystem::path staging_dir,
                std::uint32_t first_ordinal = 1,
                std::uint64_t start_offset = 0);

    /// Next staged part, nullopt once the stream is exhausted
    relay::Result<std::optional<StagedPart>, TransferError> next();

    [[nodiscard]] std::uint32_t next_ordinal() const noexcept { return next_ordinal_; }
    [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }

private:
    std::filesystem::path staging_path(std::uint32_t ordinal) const;

    std::istream& input_;
    std::uint64_t chunk_size_;
    std::filesystem::path staging_dir_;
    std::uint32_t next_ordinal_;
    std::uint64_t offset_;
    bool empty_object_ = false;
    bool finished_ = false;
    bool emitted_ = false;
};

} // namespace relay::transfer
