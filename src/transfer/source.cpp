#include "relay/transfer/source.hpp"

#include <algorithm>
#include <cstring>

namespace relay::transfer {
namespace fs = std::filesystem;

FileSource::FileSource(fs::path path) : path_(std::move(path)) {
    input_.open(path_, std::ios::binary);
    std::error_code ec;
    const auto size = fs::file_size(path_, ec);
    if (!ec) {
        size_ = static_cast<std::uint64_t>(size);
    }
}

std::optional<std::uint64_t> FileSource::expected_size() const {
    return size_;
}

relay::Result<std::size_t> FileSource::read(char* buffer, std::size_t capacity) {
    if (!input_.is_open()) {
        return relay::Err<std::size_t>(std::string("cannot open source file: ") + path_.string());
    }
    input_.read(buffer, static_cast<std::streamsize>(capacity));
    if (input_.bad()) {
        return relay::Err<std::size_t>(std::string("read failed: ") + path_.string());
    }
    return relay::Ok(static_cast<std::size_t>(input_.gcount()));
}

MemorySource::MemorySource(std::string data, bool announce_size)
    : data_(std::move(data)), announce_size_(announce_size) {}

std::optional<std::uint64_t> MemorySource::expected_size() const {
    if (!announce_size_) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(data_.size());
}

relay::Result<std::size_t> MemorySource::read(char* buffer, std::size_t capacity) {
    const auto count = std::min(capacity, data_.size() - position_);
    if (count > 0) {
        std::memcpy(buffer, data_.data() + position_, count);
        position_ += count;
    }
    return relay::Ok(count);
}

} // namespace relay::transfer
