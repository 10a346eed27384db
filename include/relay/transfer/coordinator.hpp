#pragma once

#include "relay/core/result.hpp"
#include "relay/events/event_bus.hpp"
#include "relay/transfer/config.hpp"
#include "relay/transfer/errors.hpp"
#include "relay/transfer/fallback.hpp"
#include "relay/transfer/manifest.hpp"
#include "relay/transfer/object_store.hpp"
#include "relay/transfer/progress.hpp"
#include "relay/transfer/registry.hpp"
#include "relay/transfer/session.hpp"
#include "relay/transfer/source.hpp"
#include "relay/transfer/uploader.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay::transfer {

struct TransferRequest {
    std::string owner_id;
    std::string object_name;        ///< Only the final path component is used
    std::string target_namespace;
    std::shared_ptr<ByteSource> source;
    NotificationSink notify;        ///< May be empty
};

struct TransferReport {
    std::string transfer_id;
    std::string owner_id;
    std::string object_name;
    std::string target_namespace;
    std::uint64_t total_bytes = 0;
    std::string initial_strategy;
    std::string final_strategy;
    std::vector<PartDescriptor> parts;
    std::optional<std::string> manifest_name; ///< Set when the object needed more than one part
    std::string digest;
    std::string location;                     ///< Where to fetch the object (or its manifest)
    std::uint32_t fallbacks = 0;
    std::chrono::milliseconds duration{0};
};

using TransferResult = relay::Result<TransferReport, TransferError>;

/**
 * @brief Drives transfers end to end
 *
 * Pending -> Downloading -> Strategizing -> Uploading -> Finalizing -> Done
 *
 * GUARANTEES:
 * - at most one active transfer per owner, a second request fails with
 *   ErrorKind::Busy immediately
 * - the transfer's staging directory is removed and the owner deregistered on
 *   every exit path, before the outcome is reported
 * - progress notifications are throttled; the final message is always sent
 *
 * Transfers for different owners run concurrently on an internal thread
 * pool via submit(); run() executes on the calling thread.
 */
class TransferCoordinator {
public:
    TransferCoordinator(EngineConfig config,
                        ObjectStore& store,
                        events::EventBus& bus,
                        Sleeper sleeper = thread_sleeper(),
                        ErrorClassifier classifier = {},
                        std::size_t worker_threads = 2);
    ~TransferCoordinator();

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    TransferResult run(TransferRequest request);

    /**
     * @brief Admit synchronously, execute on the thread pool
     *
     * Validation, the size ceiling and the busy check happen before this
     * returns; the future carries the transfer outcome.
     */
    relay::Result<std::future<TransferResult>, TransferError> submit(TransferRequest request);

    [[nodiscard]] bool is_busy(const std::string& owner_id) const;

    /// Objects this owner relayed successfully, oldest first
    [[nodiscard]] std::vector<std::string> uploaded_objects(const std::string& owner_id) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    struct Admission {
        TransferLease lease;
        std::string transfer_id;
        std::string object_name;
    };

    relay::Result<Admission, TransferError> admit(const TransferRequest& request);

    TransferResult execute(const TransferRequest& request, Admission admission);

    TransferResult drive(const TransferRequest& request,
                         const Admission& admission,
                         TransferSession& session,
                         const std::filesystem::path& staging_dir,
                         ProgressReporter& progress,
                         std::string& size_bucket);

    relay::Result<std::uint64_t, TransferError> download(ByteSource& source,
                                                         const std::string& object_name,
                                                         const std::filesystem::path& object_path,
                                                         ProgressReporter& progress) const;

    /// Returns true when the object went up as one part under its plain name
    relay::Result<bool, TransferError> upload_parts(const Admission& admission,
                                                    const std::filesystem::path& object_path,
                                                    std::uint64_t total_bytes,
                                                    const std::filesystem::path& staging_dir,
                                                    UploadAttempter& attempter,
                                                    FallbackOrchestrator& fallback,
                                                    ManifestBuilder& manifest,
                                                    ProgressReporter& progress,
                                                    const std::string& size_bucket);

    RetryPolicy retry_policy() const;

    EngineConfig config_;
    ObjectStore& store_;
    events::EventBus& bus_;
    Sleeper sleeper_;
    ErrorClassifier classifier_;

    ActiveTransferRegistry registry_;

    mutable std::mutex history_mutex_;
    std::unordered_map<std::string, std::vector<std::string>> uploaded_;

    boost::asio::thread_pool pool_;
};

} // namespace relay::transfer
