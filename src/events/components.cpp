#include "relay/events/components.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace relay::events {

// ════════════════════════════════════════════════════════
// TransferLoggerComponent
// ════════════════════════════════════════════════════════

TransferLoggerComponent::TransferLoggerComponent(EventBus& bus) : bus_(bus) {
    started_id_ = bus_.subscribe<TransferStartedEvent>([](const TransferStartedEvent& e) {
        spdlog::info("[TransferStarted] transfer={} owner={} object={} namespace={} expected_bytes={}",
                     e.transfer_id, e.owner_id, e.object_name, e.target_namespace, e.expected_bytes);
    });

    strategized_id_ = bus_.subscribe<TransferStrategizedEvent>([](const TransferStrategizedEvent& e) {
        spdlog::info("[TransferStrategized] transfer={} bytes={} strategy={} chunk_size={}",
                     e.transfer_id, e.total_bytes, e.strategy, e.chunk_size);
    });

    part_id_ = bus_.subscribe<PartUploadedEvent>([](const PartUploadedEvent& e) {
        spdlog::debug("[PartUploaded] transfer={} name={} ordinal={} bytes={} attempts={} strategy={}",
                      e.transfer_id, e.remote_name, e.ordinal, e.bytes, e.attempts, e.strategy);
    });

    fallback_id_ = bus_.subscribe<StrategyFallbackEvent>([](const StrategyFallbackEvent& e) {
        spdlog::warn("[StrategyFallback] transfer={} from={} to={} resume_offset={}",
                     e.transfer_id, e.from_strategy, e.to_strategy, e.resume_offset);
    });

    completed_id_ = bus_.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) {
        spdlog::info("[TransferCompleted] transfer={} object={} bytes={} parts={} strategy={} fallbacks={} duration={}ms",
                     e.transfer_id, e.object_name, e.total_bytes, e.parts, e.final_strategy, e.fallbacks,
                     e.duration.count());
    });

    failed_id_ = bus_.subscribe<TransferFailedEvent>([](const TransferFailedEvent& e) {
        spdlog::error("[TransferFailed] transfer={} object={} kind={} error={}",
                      e.transfer_id, e.object_name, e.error_kind, e.message);
    });
}

TransferLoggerComponent::~TransferLoggerComponent() {
    bus_.unsubscribe<TransferStartedEvent>(started_id_);
    bus_.unsubscribe<TransferStrategizedEvent>(strategized_id_);
    bus_.unsubscribe<PartUploadedEvent>(part_id_);
    bus_.unsubscribe<StrategyFallbackEvent>(fallback_id_);
    bus_.unsubscribe<TransferCompletedEvent>(completed_id_);
    bus_.unsubscribe<TransferFailedEvent>(failed_id_);
}

// ════════════════════════════════════════════════════════
// TransferStatsComponent
// ════════════════════════════════════════════════════════

TransferStatsComponent::TransferStatsComponent(EventBus& bus) : bus_(bus) {
    started_id_ = bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent&) {
        record_started();
    });

    fallback_id_ = bus_.subscribe<StrategyFallbackEvent>([this](const StrategyFallbackEvent& e) {
        record_fallback(e.size_bucket);
    });

    completed_id_ = bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
        record_success(e.size_bucket, e.total_bytes);
    });

    failed_id_ = bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) {
        record_failure(e.size_bucket);
    });
}

TransferStatsComponent::~TransferStatsComponent() {
    bus_.unsubscribe<TransferStartedEvent>(started_id_);
    bus_.unsubscribe<StrategyFallbackEvent>(fallback_id_);
    bus_.unsubscribe<TransferCompletedEvent>(completed_id_);
    bus_.unsubscribe<TransferFailedEvent>(failed_id_);
}

void TransferStatsComponent::record_success(const std::string& bucket, std::uint64_t bytes) {
    auto& counters = counters_for(bucket);
    counters.completed.fetch_add(1, std::memory_order_relaxed);
    counters.bytes.fetch_add(bytes, std::memory_order_relaxed);
}

void TransferStatsComponent::record_failure(const std::string& bucket) {
    counters_for(bucket).failed.fetch_add(1, std::memory_order_relaxed);
}

void TransferStatsComponent::record_fallback(const std::string& bucket) {
    counters_for(bucket).fallbacks.fetch_add(1, std::memory_order_relaxed);
}

TransferStatsComponent::BucketStats TransferStatsComponent::bucket(const std::string& name) const {
    std::shared_lock lock(mutex_);
    BucketStats stats;
    auto it = counters_.find(name);
    if (it == counters_.end()) {
        return stats;
    }
    stats.completed = it->second->completed.load(std::memory_order_relaxed);
    stats.failed = it->second->failed.load(std::memory_order_relaxed);
    stats.fallbacks = it->second->fallbacks.load(std::memory_order_relaxed);
    stats.bytes = it->second->bytes.load(std::memory_order_relaxed);
    return stats;
}

std::vector<std::string> TransferStatsComponent::buckets() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(counters_.size());
    for (const auto& [name, counters] : counters_) {
        names.push_back(name);
    }
    return names;
}

void TransferStatsComponent::print_stats() const {
    spdlog::info("═══════════════════════════════════════");
    spdlog::info("Transfer Statistics ({} started):", started());
    for (const auto& name : buckets()) {
        const auto stats = bucket(name);
        spdlog::info("  {:<10} ok={} failed={} fallbacks={} bytes={} success={:.0f}%",
                     name, stats.completed, stats.failed, stats.fallbacks, stats.bytes,
                     stats.success_rate() * 100.0);
    }
    spdlog::info("═══════════════════════════════════════");
}

TransferStatsComponent::Counters& TransferStatsComponent::counters_for(const std::string& bucket) {
    {
        std::shared_lock lock(mutex_);
        auto it = counters_.find(bucket);
        if (it != counters_.end()) {
            return *it->second;
        }
    }
    std::unique_lock lock(mutex_);
    auto& slot = counters_[bucket];
    if (!slot) {
        slot = std::make_unique<Counters>();
    }
    return *slot;
}

} // namespace relay::events
