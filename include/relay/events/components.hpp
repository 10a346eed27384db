/**
 * @file components.hpp
 * @brief Components reacting to transfer events
 *
 * EXAMPLE:
 * EventBus bus;
 * TransferLoggerComponent logger(bus);
 * TransferStatsComponent stats(bus);
 * // every transfer driven through a coordinator on `bus` is now logged and counted
 */

#pragma once

#include "relay/events/event_bus.hpp"
#include "relay/events/events.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace relay::events {

/**
 * @brief Logs every transfer event through spdlog
 */
class TransferLoggerComponent {
public:
    explicit TransferLoggerComponent(EventBus& bus);
    ~TransferLoggerComponent();

    TransferLoggerComponent(const TransferLoggerComponent&) = delete;
    TransferLoggerComponent& operator=(const TransferLoggerComponent&) = delete;

private:
    EventBus& bus_;
    std::size_t started_id_;
    std::size_t strategized_id_;
    std::size_t part_id_;
    std::size_t fallback_id_;
    std::size_t completed_id_;
    std::size_t failed_id_;
};

/**
 * @brief Process-wide success-rate counters keyed by size bucket
 *
 * Injected wherever statistics are needed instead of a shared global map.
 * Increments are atomic; buckets are created on first use.
 */
class TransferStatsComponent {
public:
    struct BucketStats {
        std::uint64_t completed = 0;
        std::uint64_t failed = 0;
        std::uint64_t fallbacks = 0;
        std::uint64_t bytes = 0;

        [[nodiscard]] double success_rate() const noexcept {
            const auto total = completed + failed;
            return total == 0 ? 0.0 : static_cast<double>(completed) / static_cast<double>(total);
        }
    };

    explicit TransferStatsComponent(EventBus& bus);
    ~TransferStatsComponent();

    TransferStatsComponent(const TransferStatsComponent&) = delete;
    TransferStatsComponent& operator=(const TransferStatsComponent&) = delete;

    void record_started() noexcept { started_.fetch_add(1, std::memory_order_relaxed); }
    void record_success(const std::string& bucket, std::uint64_t bytes);
    void record_failure(const std::string& bucket);
    void record_fallback(const std::string& bucket);

    [[nodiscard]] std::uint64_t started() const noexcept { return started_.load(std::memory_order_relaxed); }
    [[nodiscard]] BucketStats bucket(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> buckets() const;

    void print_stats() const;

private:
    struct Counters {
        std::atomic<std::uint64_t> completed{0};
        std::atomic<std::uint64_t> failed{0};
        std::atomic<std::uint64_t> fallbacks{0};
        std::atomic<std::uint64_t> bytes{0};
    };

    Counters& counters_for(const std::string& bucket);

    EventBus& bus_;
    std::size_t started_id_;
    std::size_t fallback_id_;
    std::size_t completed_id_;
    std::size_t failed_id_;

    std::atomic<std::uint64_t> started_{0};
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::unique_ptr<Counters>> counters_;
};

} // namespace relay::events
