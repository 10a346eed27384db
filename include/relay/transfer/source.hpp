#pragma once

#include "relay/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace relay::transfer {

/**
 * @brief Byte stream the object is pulled from
 *
 * read() fills up to `capacity` bytes and returns how many were written;
 * 0 means end of stream. Errors are fatal for the transfer: the engine never
 * uploads a partially downloaded object.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Size announced up front, if the provider knows it
    virtual std::optional<std::uint64_t> expected_size() const = 0;

    virtual relay::Result<std::size_t> read(char* buffer, std::size_t capacity) = 0;
};

class FileSource : public ByteSource {
public:
    explicit FileSource(std::filesystem::path path);

    std::optional<std::uint64_t> expected_size() const override;
    relay::Result<std::size_t> read(char* buffer, std::size_t capacity) override;

private:
    std::filesystem::path path_;
    std::ifstream input_;
    std::optional<std::uint64_t> size_;
};

/**
 * @brief In-memory source, optionally hiding its size until the end
 */
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::string data, bool announce_size = true);

    std::optional<std::uint64_t> expected_size() const override;
    relay::Result<std::size_t> read(char* buffer, std::size_t capacity) override;

private:
    std::string data_;
    std::size_t position_ = 0;
    bool announce_size_;
};

} // namespace relay::transfer
