#include "relay/transfer/checksum.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace relay::transfer {
namespace {

constexpr std::uint64_t kPrime = 0x100000001b3ULL;
constexpr std::size_t kReadBlock = 64 * 1024;

} // namespace

void ChecksumAccumulator::update(const char* data, std::size_t size) noexcept {
    for (std::size_t i = 0; i < size; ++i) {
        hash_ ^= static_cast<std::uint64_t>(static_cast<unsigned char>(data[i]));
        hash_ *= kPrime;
    }
}

std::string ChecksumAccumulator::hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash_) * 2) << std::setfill('0') << hash_;
    return oss.str();
}

std::string checksum_bytes(const std::vector<char>& data) {
    ChecksumAccumulator accumulator;
    accumulator.update(data.data(), data.size());
    return accumulator.hex();
}

std::string checksum_stream(std::istream& input) {
    ChecksumAccumulator accumulator;
    std::array<char, kReadBlock> buffer{};
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        accumulator.update(buffer.data(), static_cast<std::size_t>(input.gcount()));
    }
    return accumulator.hex();
}

relay::Result<std::string, TransferError> checksum_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return relay::Err<std::string>(TransferError(ErrorKind::LocalIo, "cannot open for checksum: " + path.string()));
    }
    auto digest = checksum_stream(input);
    if (input.bad()) {
        return relay::Err<std::string>(TransferError(ErrorKind::LocalIo, "read failed during checksum: " + path.string()));
    }
    return relay::Ok(std::move(digest));
}

} // namespace relay::transfer
