#include "relay/transfer/uploader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <thread>

namespace relay::transfer {

Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds delay) {
        std::this_thread::sleep_for(delay);
    };
}

const char* to_string(UploadFailureKind kind) noexcept {
    switch (kind) {
        case UploadFailureKind::QuotaRejected: return "quota_rejected";
        case UploadFailureKind::Exhausted: return "exhausted";
        case UploadFailureKind::LocalIo: return "local_io";
    }
    return "unknown";
}

UploadAttempter::UploadAttempter(ObjectStore& store,
                                 std::string target_namespace,
                                 RetryPolicy policy,
                                 ErrorClassifier classifier,
                                 Sleeper sleeper)
    : store_(store),
      namespace_(std::move(target_namespace)),
      policy_(policy),
      classifier_(std::move(classifier)),
      sleeper_(std::move(sleeper)) {
    if (policy_.max_attempts == 0) {
        policy_.max_attempts = 1;
    }
    if (!classifier_) {
        classifier_ = make_marker_classifier(default_quota_markers());
    }
}

relay::Result<UploadReceipt, UploadFailure> UploadAttempter::attempt(const StagedPart& part,
                                                                     const std::string& destination_name,
                                                                     const ChunkStrategy& strategy) {
    auto bytes = part.read_bytes();
    if (bytes.is_error()) {
        return relay::Err<UploadReceipt>(UploadFailure{UploadFailureKind::LocalIo, 0, bytes.error().message});
    }

    spdlog::debug("[UploadAttempt] name={} ordinal={} bytes={} strategy={}",
                  destination_name, part.ordinal(), part.length(), strategy.name);
    return put_with_retry(bytes.value(), destination_name, true);
}

relay::Result<UploadReceipt, UploadFailure> UploadAttempter::attempt_manifest(const std::filesystem::path& manifest_path,
                                                                              const std::string& destination_name) {
    std::ifstream input(manifest_path, std::ios::binary);
    if (!input) {
        return relay::Err<UploadReceipt>(
            UploadFailure{UploadFailureKind::LocalIo, 0, "cannot open manifest: " + manifest_path.string()});
    }
    std::vector<char> bytes((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    return put_with_retry(bytes, destination_name, false);
}

relay::Result<UploadReceipt, UploadFailure> UploadAttempter::put_with_retry(const std::vector<char>& bytes,
                                                                            const std::string& destination_name,
                                                                            bool adaptive) {
    std::string last_error;
    for (std::uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        relay::Result<void, BackendError> result = relay::Ok();
        try {
            result = store_.put(destination_name, bytes, namespace_);
        } catch (const std::exception& e) {
            result = relay::Err<void>(BackendError(std::string("backend threw: ") + e.what()));
        }

        if (result.is_ok()) {
            return relay::Ok(UploadReceipt{destination_name, static_cast<std::uint64_t>(bytes.size()), attempt});
        }

        const auto& error = result.error();
        last_error = error.message;

        if (classifier_(error) == BackendErrorKind::Quota) {
            if (adaptive) {
                shrink_ceiling(bytes.size());
            }
            spdlog::warn("[UploadRejected] name={} bytes={} ceiling={} error={}",
                         destination_name, bytes.size(), ceiling_, truncate_diagnostic(last_error));
            return relay::Err<UploadReceipt>(UploadFailure{UploadFailureKind::QuotaRejected, attempt, last_error});
        }

        if (attempt == policy_.max_attempts) {
            break;
        }

        const auto delay = error.retry_after.value_or(policy_.base_delay * attempt);
        spdlog::warn("[UploadRetry] name={} attempt={}/{} backoff={}ms error={}",
                     destination_name, attempt, policy_.max_attempts, delay.count(),
                     truncate_diagnostic(last_error));
        sleeper_(delay);
    }

    spdlog::error("[UploadExhausted] name={} attempts={} error={}",
                  destination_name, policy_.max_attempts, truncate_diagnostic(last_error));
    return relay::Err<UploadReceipt>(UploadFailure{UploadFailureKind::Exhausted, policy_.max_attempts, last_error});
}

void UploadAttempter::shrink_ceiling(std::uint64_t rejected_length) {
    const auto basis = std::min(ceiling_, rejected_length);
    const auto shrunk = static_cast<std::uint64_t>(static_cast<double>(basis) * policy_.shrink_factor);
    ceiling_ = std::max(policy_.min_chunk_bytes, shrunk);
}

} // namespace relay::transfer
