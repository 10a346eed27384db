#include "relay/transfer/source.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

using relay::transfer::FileSource;
using relay::transfer::MemorySource;

namespace {

std::string drain(relay::transfer::ByteSource& source, std::size_t block) {
    std::string out;
    std::vector<char> buffer(block);
    while (true) {
        auto chunk = source.read(buffer.data(), buffer.size());
        EXPECT_TRUE(chunk.is_ok());
        if (chunk.is_error() || chunk.value() == 0) {
            break;
        }
        out.append(buffer.data(), chunk.value());
    }
    return out;
}

} // namespace

TEST(ByteSourceTest, FileSourceAnnouncesSizeAndStreams) {
    const auto dir = relay::test_support::create_temp_dir("source");
    const auto data = relay::test_support::pattern_bytes(5000);
    relay::test_support::write_file(dir / "in.bin", data);

    FileSource source(dir / "in.bin");
    EXPECT_EQ(source.expected_size().value_or(0), 5000u);
    EXPECT_EQ(drain(source, 777), data);
    std::filesystem::remove_all(dir);
}

TEST(ByteSourceTest, MissingFileFailsOnRead) {
    FileSource source("/nonexistent/relay/input.bin");
    EXPECT_FALSE(source.expected_size().has_value());
    char buffer[16];
    EXPECT_TRUE(source.read(buffer, sizeof(buffer)).is_error());
}

TEST(ByteSourceTest, MemorySourceCanHideItsSize) {
    MemorySource announced("hello");
    MemorySource hidden("hello", false);

    EXPECT_EQ(announced.expected_size().value_or(0), 5u);
    EXPECT_FALSE(hidden.expected_size().has_value());
    EXPECT_EQ(drain(hidden, 2), "hello");
}
