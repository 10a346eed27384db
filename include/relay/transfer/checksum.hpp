#pragma once

#include "relay/core/result.hpp"
#include "relay/transfer/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace relay::transfer {

/**
 * @brief Incremental FNV-1a (64 bit) digest
 *
 * Feed bytes in any split; hex() is always 16 lowercase hex characters.
 */
class ChecksumAccumulator {
public:
    void update(const char* data, std::size_t size) noexcept;

    [[nodiscard]] std::uint64_t value() const noexcept { return hash_; }
    [[nodiscard]] std::string hex() const;

private:
    std::uint64_t hash_ = 0xcbf29ce484222325ULL;
};

std::string checksum_bytes(const std::vector<char>& data);

/// Streams the input in fixed-size blocks, never holding the whole object
std::string checksum_stream(std::istream& input);

relay::Result<std::string, TransferError> checksum_file(const std::filesystem::path& path);

} // namespace relay::transfer
