#pragma once

#include "relay/core/result.hpp"
#include "relay/transfer/chunk_writer.hpp"
#include "relay/transfer/errors.hpp"
#include "relay/transfer/object_store.hpp"
#include "relay/transfer/strategy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <string>
#include <vector>

namespace relay::transfer {

/// Blocking wait used between retries; tests inject a recorder instead
using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper thread_sleeper();

struct RetryPolicy {
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds base_delay{2000};
    double shrink_factor = 0.8;
    std::uint64_t min_chunk_bytes = 1 * kMiB;
};

struct UploadReceipt {
    std::string name;
    std::uint64_t bytes = 0;
    std::uint32_t attempts = 0;
};

enum class UploadFailureKind {
    QuotaRejected, ///< Not retryable at the current strategy
    Exhausted,     ///< Transient failures used up every attempt
    LocalIo        ///< The staged bytes could not be read back
};

const char* to_string(UploadFailureKind kind) noexcept;

struct UploadFailure {
    UploadFailureKind kind = UploadFailureKind::Exhausted;
    std::uint32_t attempts = 0;
    std::string last_error;
};

/**
 * @brief Pushes one part to the store with bounded retries
 *
 * Transient failures are retried in place with linear backoff
 * (retry_index * base_delay, or the backend's retry-after hint when present).
 * Quota rejections return immediately and shrink this attempter's chunk-size
 * ceiling, so one instance must be used per transfer.
 */
class UploadAttempter {
public:
    UploadAttempter(ObjectStore& store,
                    std::string target_namespace,
                    RetryPolicy policy,
                    ErrorClassifier classifier,
                    Sleeper sleeper = thread_sleeper());

    relay::Result<UploadReceipt, UploadFailure> attempt(const StagedPart& part,
                                                        const std::string& destination_name,
                                                        const ChunkStrategy& strategy);

    /// Single-part upload of a manifest file; never split, never shrinks the ceiling
    relay::Result<UploadReceipt, UploadFailure> attempt_manifest(const std::filesystem::path& manifest_path,
                                                                 const std::string& destination_name);

    /// Largest chunk size the backend has not yet rejected for this transfer
    [[nodiscard]] std::uint64_t ceiling() const noexcept { return ceiling_; }

    [[nodiscard]] const std::string& target_namespace() const noexcept { return namespace_; }

private:
    relay::Result<UploadReceipt, UploadFailure> put_with_retry(const std::vector<char>& bytes,
                                                               const std::string& destination_name,
                                                               bool adaptive);

    void shrink_ceiling(std::uint64_t rejected_length);

    ObjectStore& store_;
    std::string namespace_;
    RetryPolicy policy_;
    ErrorClassifier classifier_;
    Sleeper sleeper_;
    std::uint64_t ceiling_ = std::numeric_limits<std::uint64_t>::max();
};

} // namespace relay::transfer
