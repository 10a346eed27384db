#include "relay/transfer/chunk_writer.hpp"

#include "relay/transfer/checksum.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace relay::transfer {
namespace fs = std::filesystem;
namespace {

constexpr std::size_t kCopyBlock = 1024 * 1024;

} // namespace

// ════════════════════════════════════════════════════════
// StagedPart
// ════════════════════════════════════════════════════════

StagedPart::StagedPart(fs::path path,
                       std::uint32_t ordinal,
                       std::uint64_t offset,
                       std::uint64_t length,
                       std::string checksum)
    : path_(std::move(path)),
      ordinal_(ordinal),
      offset_(offset),
      length_(length),
      checksum_(std::move(checksum)) {}

StagedPart::~StagedPart() {
    release();
}

StagedPart::StagedPart(StagedPart&& other) noexcept
    : path_(std::move(other.path_)),
      ordinal_(other.ordinal_),
      offset_(other.offset_),
      length_(other.length_),
      checksum_(std::move(other.checksum_)) {
    other.path_.clear();
}

StagedPart& StagedPart::operator=(StagedPart&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        ordinal_ = other.ordinal_;
        offset_ = other.offset_;
        length_ = other.length_;
        checksum_ = std::move(other.checksum_);
        other.path_.clear();
    }
    return *this;
}

relay::Result<std::vector<char>, TransferError> StagedPart::read_bytes() const {
    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return relay::Err<std::vector<char>>(
            TransferError(ErrorKind::LocalIo, "staged part missing: " + path_.string()));
    }
    std::vector<char> bytes(static_cast<std::size_t>(length_));
    input.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (static_cast<std::uint64_t>(input.gcount()) != length_) {
        return relay::Err<std::vector<char>>(
            TransferError(ErrorKind::LocalIo, "short read from staged part: " + path_.string()));
    }
    return relay::Ok(std::move(bytes));
}

void StagedPart::release() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::warn("[Staging] failed to remove {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}

// ════════════════════════════════════════════════════════
// ChunkWriter
// ════════════════════════════════════════════════════════

ChunkWriter::ChunkWriter(std::istream& input,
                         std::uint64_t chunk_size,
                         fs::path staging_dir,
                         std::uint32_t first_ordinal,
                         std::uint64_t start_offset)
    : input_(input),
      chunk_size_(chunk_size),
      staging_dir_(std::move(staging_dir)),
      next_ordinal_(first_ordinal),
      offset_(start_offset),
      empty_object_(first_ordinal == 1 && start_offset == 0) {}

relay::Result<std::optional<StagedPart>, TransferError> ChunkWriter::next() {
    using Next = std::optional<StagedPart>;

    if (chunk_size_ == 0) {
        return relay::Err<Next>(TransferError(ErrorKind::InvalidRequest, "chunk size must be > 0"));
    }
    if (finished_) {
        return relay::Ok(Next{});
    }

    const auto path = staging_path(next_ordinal_);
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return relay::Err<Next>(TransferError(ErrorKind::LocalIo, "cannot create staging file: " + path.string()));
    }

    ChecksumAccumulator checksum;
    std::vector<char> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size_, kCopyBlock)));
    std::uint64_t written = 0;

    while (written < chunk_size_) {
        const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), chunk_size_ - written));
        input_.read(buffer.data(), want);
        const auto got = input_.gcount();
        if (got > 0) {
            output.write(buffer.data(), got);
            if (!output) {
                output.close();
                std::error_code ec;
                fs::remove(path, ec);
                return relay::Err<Next>(TransferError(ErrorKind::LocalIo, "write failed: " + path.string()));
            }
            checksum.update(buffer.data(), static_cast<std::size_t>(got));
            written += static_cast<std::uint64_t>(got);
        }
        if (got < want) {
            if (input_.bad()) {
                output.close();
                std::error_code ec;
                fs::remove(path, ec);
                return relay::Err<Next>(TransferError(ErrorKind::LocalIo, "read failed while chunking"));
            }
            finished_ = true;
            break;
        }
    }
    output.close();

    // An empty object still yields exactly one part; any other empty tail is dropped.
    if (written == 0 && (emitted_ || !empty_object_)) {
        std::error_code ec;
        fs::remove(path, ec);
        finished_ = true;
        return relay::Ok(Next{});
    }

    StagedPart part(path, next_ordinal_, offset_, written, checksum.hex());
    ++next_ordinal_;
    offset_ += written;
    emitted_ = true;
    if (written == 0) {
        finished_ = true;
    }
    return relay::Ok(Next(std::move(part)));
}

fs::path ChunkWriter::staging_path(std::uint32_t ordinal) const {
    std::ostringstream name;
    name << "part-" << std::setw(6) << std::setfill('0') << ordinal << ".bin";
    return staging_dir_ / name.str();
}

} // namespace relay::transfer
