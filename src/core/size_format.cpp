#include "relay/core/size_format.hpp"

#include <array>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace relay {
namespace {

constexpr std::array<const char*, 5> kUnits{"KiB", "MiB", "GiB", "TiB", "PiB"};

std::string scaled(double value) {
    std::size_t unit = 0;
    value /= 1024.0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << ' ' << kUnits[unit];
    return oss.str();
}

} // namespace

std::string format_bytes(std::uint64_t bytes) {
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    return scaled(static_cast<double>(bytes));
}

std::string format_rate(std::uint64_t bytes, std::chrono::milliseconds elapsed) {
    if (elapsed.count() <= 0) {
        return "--/s";
    }
    const double per_second = static_cast<double>(bytes) * 1000.0 / static_cast<double>(elapsed.count());
    if (per_second < 1024.0) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(0) << per_second << " B/s";
        return oss.str();
    }
    return scaled(per_second) + "/s";
}

unsigned percent_of(std::uint64_t done, std::uint64_t total) {
    if (total == 0 || done >= total) {
        return 100;
    }
    return static_cast<unsigned>((static_cast<long double>(done) * 100.0L) / static_cast<long double>(total));
}

std::optional<std::uint64_t> parse_byte_count(const std::string& text) {
    std::uint64_t value = 0;
    const char* end = text.data() + text.size();
    const auto [last, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc() || last != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace relay
