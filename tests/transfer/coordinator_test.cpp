#include "relay/transfer/coordinator.hpp"

#include "relay/events/components.hpp"
#include "relay/events/events.hpp"
#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using relay::events::EventBus;
using relay::events::StrategyFallbackEvent;
using relay::events::TransferStatsComponent;
using relay::test_support::FakeStore;
using relay::test_support::RecordingSleeper;
using relay::transfer::BackendError;
using relay::transfer::EngineConfig;
using relay::transfer::ErrorKind;
using relay::transfer::MemorySource;
using relay::transfer::StrategyTable;
using relay::transfer::TransferCoordinator;
using relay::transfer::TransferRequest;

namespace {

/// Yields `good_bytes` bytes, then fails like a dropped connection
class FailingSource : public relay::transfer::ByteSource {
public:
    explicit FailingSource(std::size_t good_bytes) : remaining_(good_bytes) {}

    std::optional<std::uint64_t> expected_size() const override { return 1000; }

    relay::Result<std::size_t> read(char* buffer, std::size_t capacity) override {
        if (remaining_ == 0) {
            return relay::Err<std::size_t>(std::string("connection reset while downloading"));
        }
        const auto count = std::min(capacity, remaining_);
        std::fill(buffer, buffer + count, 'z');
        remaining_ -= count;
        return relay::Ok(count);
    }

private:
    std::size_t remaining_;
};

/// Announces more bytes than it delivers, then reports a clean end of stream
class ShortSource : public relay::transfer::ByteSource {
public:
    ShortSource(std::uint64_t announced, std::size_t delivered) : announced_(announced), remaining_(delivered) {}

    std::optional<std::uint64_t> expected_size() const override { return announced_; }

    relay::Result<std::size_t> read(char* buffer, std::size_t capacity) override {
        const auto count = std::min(capacity, remaining_);
        std::fill(buffer, buffer + count, 's');
        remaining_ -= count;
        return relay::Ok(count);
    }

private:
    std::uint64_t announced_;
    std::size_t remaining_;
};

std::string rebuild(const FakeStore& store, const std::vector<relay::transfer::PartDescriptor>& parts) {
    std::string out;
    for (const auto& part : parts) {
        out += store.object("ns", part.name).value_or("<missing>");
    }
    return out;
}

class TransferCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        staging_ = relay::test_support::create_temp_dir("coordinator");
        config_.staging_root = staging_;
        config_.min_chunk_bytes = 1;
        config_.base_delay = 1000ms;
        config_.progress_interval = 0ms;
        // Scaled-down ladder: 500 / 200 / 90 / 10 byte chunks.
        auto table = StrategyTable::create({
            {"tiny", 100, 10},
            {"safe", 200, 90},
            {"balanced", 1000, 200},
            {"aggressive", 5000, 500},
        });
        ASSERT_TRUE(table.is_ok());
        config_.strategies = table.value();
    }

    void TearDown() override {
        fs::remove_all(staging_);
    }

    std::unique_ptr<TransferCoordinator> make_coordinator() {
        return std::make_unique<TransferCoordinator>(config_, store_, bus_, sleeper_.sleeper());
    }

    TransferRequest request(const std::string& owner, const std::string& name, const std::string& data,
                            bool announce_size = true) {
        TransferRequest req;
        req.owner_id = owner;
        req.object_name = name;
        req.target_namespace = "ns";
        req.source = std::make_shared<MemorySource>(data, announce_size);
        req.notify = [this](const std::string& text) {
            std::lock_guard lock(notes_mutex_);
            notes_.push_back(text);
        };
        return req;
    }

    std::vector<std::string> notes() {
        std::lock_guard lock(notes_mutex_);
        return notes_;
    }

    fs::path staging_;
    EngineConfig config_;
    FakeStore store_;
    EventBus bus_;
    RecordingSleeper sleeper_;
    std::mutex notes_mutex_;
    std::vector<std::string> notes_;
};

} // namespace

TEST_F(TransferCoordinatorTest, FallsBackToSmallerStrategyAndCompletes) {
    store_.set_max_object_bytes(90);
    std::vector<StrategyFallbackEvent> fallbacks;
    bus_.subscribe<StrategyFallbackEvent>([&](const StrategyFallbackEvent& e) { fallbacks.push_back(e); });
    auto coordinator = make_coordinator();
    const auto data = relay::test_support::pattern_bytes(250);

    auto result = coordinator->run(request("alice", "clip.bin", data));

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    const auto& report = result.value();
    EXPECT_EQ(report.total_bytes, 250u);
    EXPECT_EQ(report.initial_strategy, "balanced");
    EXPECT_EQ(report.final_strategy, "safe");
    EXPECT_EQ(report.fallbacks, 1u);
    ASSERT_EQ(report.parts.size(), 3u);
    EXPECT_EQ(report.parts[0].size, 90u);
    EXPECT_EQ(report.parts[1].size, 90u);
    EXPECT_EQ(report.parts[2].size, 70u);

    ASSERT_EQ(fallbacks.size(), 1u);
    EXPECT_EQ(fallbacks[0].from_strategy, "balanced");
    EXPECT_EQ(fallbacks[0].to_strategy, "safe");
    EXPECT_EQ(fallbacks[0].resume_offset, 0u);

    const auto base = "clip.bin." + report.transfer_id;
    ASSERT_TRUE(report.manifest_name.has_value());
    EXPECT_EQ(*report.manifest_name, base + ".manifest.json");
    EXPECT_EQ(report.location, "mem://ns/" + base + ".manifest.json");

    const auto sizes = store_.attempted_sizes();
    ASSERT_GE(sizes.size(), 4u);
    EXPECT_EQ(sizes[0], 200u);
    EXPECT_EQ(sizes[1], 90u);

    auto manifest_text = store_.object("ns", *report.manifest_name);
    ASSERT_TRUE(manifest_text.has_value());
    auto manifest = relay::transfer::manifest_from_json(nlohmann::json::parse(*manifest_text));
    ASSERT_TRUE(manifest.is_ok());
    EXPECT_EQ(manifest.value().total_size, 250u);
    EXPECT_EQ(manifest.value().total_parts, 3u);
    EXPECT_EQ(manifest.value().chunk_size, 90u);
    EXPECT_EQ(manifest.value().strategy, "safe");
    EXPECT_EQ(manifest.value().owner, "alice");
    EXPECT_EQ(manifest.value().parts[0].name, base + ".part001");

    std::string rebuilt;
    for (const auto& part : manifest.value().parts) {
        rebuilt += store_.object("ns", part.name).value_or("<missing>");
    }
    EXPECT_EQ(rebuilt, data);

    const auto messages = notes();
    ASSERT_FALSE(messages.empty());
    EXPECT_NE(messages.back().find("Uploaded clip.bin"), std::string::npos);
    EXPECT_NE(messages.back().find("'safe'"), std::string::npos);
}

TEST_F(TransferCoordinatorTest, RejectionMidwayResumesAfterLastAcceptedPart) {
    store_.fail_on_call(3, BackendError("413 Request Entity Too Large"));
    std::vector<StrategyFallbackEvent> fallbacks;
    bus_.subscribe<StrategyFallbackEvent>([&](const StrategyFallbackEvent& e) { fallbacks.push_back(e); });
    auto coordinator = make_coordinator();
    const auto data = relay::test_support::pattern_bytes(1000);

    auto result = coordinator->run(request("alice", "big.iso", data));

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    const auto& parts = result.value().parts;
    ASSERT_EQ(parts.size(), 9u);
    EXPECT_EQ(parts[0].size, 200u);
    EXPECT_EQ(parts[1].size, 200u);
    for (std::size_t i = 2; i < 8; ++i) {
        EXPECT_EQ(parts[i].size, 90u) << "part " << parts[i].ordinal;
    }
    EXPECT_EQ(parts[8].size, 60u);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        EXPECT_EQ(parts[i].ordinal, i + 1);
    }

    ASSERT_EQ(fallbacks.size(), 1u);
    EXPECT_EQ(fallbacks[0].resume_offset, 400u);

    std::string rebuilt;
    for (const auto& part : parts) {
        rebuilt += store_.object("ns", part.name).value_or("<missing>");
    }
    EXPECT_EQ(rebuilt, data);
}

TEST_F(TransferCoordinatorTest, SmallObjectGoesUpUnderItsOwnName) {
    auto coordinator = make_coordinator();

    auto result = coordinator->run(request("alice", "docs/note.txt", "12345678"));

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_FALSE(result.value().manifest_name.has_value());
    EXPECT_EQ(result.value().object_name, "note.txt");
    EXPECT_EQ(result.value().location, "mem://ns/note.txt");
    EXPECT_EQ(store_.stored_names(), (std::vector<std::string>{"note.txt"}));
    EXPECT_EQ(store_.object("ns", "note.txt").value_or(""), "12345678");
}

TEST_F(TransferCoordinatorTest, EmptyObjectIsOneEmptyPart) {
    auto coordinator = make_coordinator();

    auto result = coordinator->run(request("alice", "empty.bin", ""));

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value().total_bytes, 0u);
    ASSERT_EQ(result.value().parts.size(), 1u);
    EXPECT_EQ(result.value().parts[0].size, 0u);
    EXPECT_EQ(store_.object("ns", "empty.bin").value_or("missing"), "");
}

TEST_F(TransferCoordinatorTest, LadderExhaustedWhenBackendRejectsEverything) {
    store_.set_max_object_bytes(5);
    TransferStatsComponent stats(bus_);
    auto coordinator = make_coordinator();

    auto result = coordinator->run(request("alice", "huge.bin", relay::test_support::pattern_bytes(250)));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::LadderExhausted);
    EXPECT_NE(result.error().message.find("413"), std::string::npos);
    EXPECT_EQ(store_.attempted_sizes(), (std::vector<std::size_t>{200, 90, 10}));
    EXPECT_EQ(stats.bucket("balanced").failed, 1u);
    EXPECT_EQ(stats.bucket("balanced").fallbacks, 2u);

    EXPECT_TRUE(relay::test_support::directory_empty(staging_));
    EXPECT_FALSE(coordinator->is_busy("alice"));
    EXPECT_NE(notes().back().find("smallest chunk size"), std::string::npos);
}

TEST_F(TransferCoordinatorTest, TransientFailuresExhaustRetries) {
    for (int i = 0; i < 3; ++i) {
        store_.script(BackendError("connection reset by peer"));
    }
    auto coordinator = make_coordinator();

    auto result = coordinator->run(request("alice", "a.bin", "abc"));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::BackendTransient);
    EXPECT_EQ(store_.calls(), 3u);
    EXPECT_EQ(*sleeper_.delays, (std::vector<std::chrono::milliseconds>{1000ms, 2000ms}));
}

TEST_F(TransferCoordinatorTest, TransientFailureThenSuccess) {
    store_.script(BackendError("timeout"));
    auto coordinator = make_coordinator();

    auto result = coordinator->run(request("alice", "a.bin", "abc"));

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(store_.calls(), 2u);
    EXPECT_EQ(result.value().fallbacks, 0u);
}

TEST_F(TransferCoordinatorTest, DownloadFailureUploadsNothing) {
    TransferStatsComponent stats(bus_);
    auto coordinator = make_coordinator();

    TransferRequest req = request("alice", "broken.bin", "");
    req.source = std::make_shared<FailingSource>(40);
    auto result = coordinator->run(std::move(req));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::SourceRead);
    EXPECT_EQ(store_.calls(), 0u);
    EXPECT_EQ(stats.bucket(relay::events::kUnsizedBucket).failed, 1u);
    EXPECT_TRUE(relay::test_support::directory_empty(staging_));
    EXPECT_FALSE(coordinator->is_busy("alice"));
}

TEST_F(TransferCoordinatorTest, AnnouncedOversizeIsRefusedBeforeRegistration) {
    config_.max_object_bytes = 100;
    TransferStatsComponent stats(bus_);
    auto coordinator = make_coordinator();

    auto result = coordinator->run(request("alice", "big.bin", relay::test_support::pattern_bytes(250)));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::SizeLimitExceeded);
    EXPECT_EQ(stats.started(), 0u);
    EXPECT_EQ(store_.calls(), 0u);
}

TEST_F(TransferCoordinatorTest, UnannouncedOversizeAbortsDownload) {
    config_.max_object_bytes = 100;
    TransferStatsComponent stats(bus_);
    auto coordinator = make_coordinator();

    auto result = coordinator->run(request("alice", "big.bin", relay::test_support::pattern_bytes(250), false));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::SizeLimitExceeded);
    EXPECT_EQ(stats.started(), 1u);
    EXPECT_EQ(store_.calls(), 0u);
    EXPECT_TRUE(relay::test_support::directory_empty(staging_));
}

TEST_F(TransferCoordinatorTest, InvalidRequests) {
    auto coordinator = make_coordinator();

    auto no_owner = request("", "a.bin", "x");
    EXPECT_EQ(coordinator->run(no_owner).error().kind, ErrorKind::InvalidRequest);

    auto no_source = request("alice", "a.bin", "x");
    no_source.source.reset();
    EXPECT_EQ(coordinator->run(no_source).error().kind, ErrorKind::InvalidRequest);

    auto no_name = request("alice", "", "x");
    EXPECT_EQ(coordinator->run(no_name).error().kind, ErrorKind::InvalidRequest);

    auto no_namespace = request("alice", "a.bin", "x");
    no_namespace.target_namespace.clear();
    EXPECT_EQ(coordinator->run(no_namespace).error().kind, ErrorKind::InvalidRequest);

    EXPECT_FALSE(coordinator->is_busy("alice"));
}

TEST_F(TransferCoordinatorTest, SecondTransferForBusyOwnerIsRejected) {
    store_.hold();
    auto coordinator = make_coordinator();

    auto first = coordinator->submit(request("alice", "one.bin", "first"));
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(store_.wait_until_entered(5s));
    EXPECT_TRUE(coordinator->is_busy("alice"));

    auto second = coordinator->run(request("alice", "two.bin", "second"));
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().kind, ErrorKind::Busy);

    store_.release();
    auto outcome = first.value().get();
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().message;
    EXPECT_FALSE(coordinator->is_busy("alice"));

    auto third = coordinator->run(request("alice", "two.bin", "second"));
    EXPECT_TRUE(third.is_ok());
}

TEST_F(TransferCoordinatorTest, DifferentOwnersRunConcurrently) {
    auto coordinator = make_coordinator();

    auto alice = coordinator->submit(request("alice", "a.bin", relay::test_support::pattern_bytes(150)));
    auto bob = coordinator->submit(request("bob", "b.bin", relay::test_support::pattern_bytes(150)));
    ASSERT_TRUE(alice.is_ok());
    ASSERT_TRUE(bob.is_ok());

    auto alice_result = alice.value().get();
    auto bob_result = bob.value().get();
    ASSERT_TRUE(alice_result.is_ok());
    ASSERT_TRUE(bob_result.is_ok());
    EXPECT_NE(alice_result.value().transfer_id, bob_result.value().transfer_id);
    EXPECT_EQ(alice_result.value().parts.size(), 2u);
}

TEST_F(TransferCoordinatorTest, SuccessCleansStagingAndRecordsHistory) {
    TransferStatsComponent stats(bus_);
    auto coordinator = make_coordinator();

    ASSERT_TRUE(coordinator->run(request("alice", "first.bin", "1")).is_ok());
    ASSERT_TRUE(coordinator->run(request("alice", "second.bin", relay::test_support::pattern_bytes(120))).is_ok());

    EXPECT_TRUE(relay::test_support::directory_empty(staging_));
    EXPECT_FALSE(coordinator->is_busy("alice"));
    EXPECT_EQ(coordinator->uploaded_objects("alice"), (std::vector<std::string>{"first.bin", "second.bin"}));
    EXPECT_TRUE(coordinator->uploaded_objects("bob").empty());
    EXPECT_EQ(stats.bucket("tiny").completed, 1u);
    EXPECT_EQ(stats.bucket("safe").completed, 1u);
}

TEST_F(TransferCoordinatorTest, ObjectNameIsReducedToFinalComponent) {
    auto coordinator = make_coordinator();

    auto result = coordinator->run(request("alice", "../../etc/passwd", "root:x"));

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value().object_name, "passwd");
}

TEST_F(TransferCoordinatorTest, SourceEndingBeforeAnnouncedSizeFails) {
    TransferStatsComponent stats(bus_);
    auto coordinator = make_coordinator();

    TransferRequest req = request("alice", "short.bin", "");
    req.source = std::make_shared<ShortSource>(1000, 10);
    auto result = coordinator->run(std::move(req));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::SourceRead);
    EXPECT_NE(result.error().message.find("announced 1000"), std::string::npos);
    EXPECT_EQ(store_.calls(), 0u);
    EXPECT_EQ(stats.bucket(relay::events::kUnsizedBucket).failed, 1u);
    EXPECT_TRUE(relay::test_support::directory_empty(staging_));
    EXPECT_TRUE(coordinator->uploaded_objects("alice").empty());
}

TEST_F(TransferCoordinatorTest, RestartedCoordinatorDoesNotOverwriteEarlierParts) {
    const auto original = relay::test_support::pattern_bytes(150);
    const std::string replacement(150, 'X');

    auto first = make_coordinator()->run(request("alice", "clip.bin", original));
    auto second = make_coordinator()->run(request("alice", "clip.bin", replacement));

    ASSERT_TRUE(first.is_ok()) << first.error().message;
    ASSERT_TRUE(second.is_ok()) << second.error().message;
    EXPECT_NE(first.value().transfer_id, second.value().transfer_id);
    EXPECT_EQ(first.value().transfer_id.rfind("alice-", 0), 0u);
    EXPECT_NE(*first.value().manifest_name, *second.value().manifest_name);

    EXPECT_EQ(rebuild(store_, first.value().parts), original);
    EXPECT_EQ(rebuild(store_, second.value().parts), replacement);
}

TEST_F(TransferCoordinatorTest, CoordinatorsSharingStagingRootKeepTransfersApart) {
    const auto original = relay::test_support::pattern_bytes(150);
    const std::string replacement(150, 'X');
    auto one = make_coordinator();
    auto two = make_coordinator();
    store_.hold();

    auto first = one->submit(request("alice", "clip.bin", original));
    auto second = two->submit(request("alice", "clip.bin", replacement));
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    // Both transfers have staged their object and are parked in the store.
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (store_.calls() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(store_.calls(), 2u);
    store_.release();

    auto first_result = first.value().get();
    auto second_result = second.value().get();
    ASSERT_TRUE(first_result.is_ok()) << first_result.error().message;
    ASSERT_TRUE(second_result.is_ok()) << second_result.error().message;
    EXPECT_EQ(rebuild(store_, first_result.value().parts), original);
    EXPECT_EQ(rebuild(store_, second_result.value().parts), replacement);
    EXPECT_TRUE(relay::test_support::directory_empty(staging_));
}
