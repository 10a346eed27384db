#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace relay::transfer {

/**
 * @brief Terminal failure classes surfaced by the engine
 *
 * Retry-level errors never show up here: the attempter absorbs transient
 * failures and the fallback orchestrator absorbs quota rejections until the
 * ladder runs out.
 */
enum class ErrorKind {
    SourceRead,
    BackendQuota,
    BackendTransient,
    LadderExhausted,
    SizeLimitExceeded,
    Busy,
    LocalIo,
    InvalidRequest,
    InvalidConfig
};

const char* to_string(ErrorKind kind) noexcept;

struct TransferError {
    static constexpr std::size_t kMaxDiagnostic = 300;

    ErrorKind kind = ErrorKind::LocalIo;
    std::string message; ///< Diagnostic, truncated to kMaxDiagnostic

    TransferError() = default;
    TransferError(ErrorKind k, std::string diagnostic);

    /// Classified text suitable for the notification sink
    std::string user_message() const;
};

std::string truncate_diagnostic(std::string text, std::size_t max_length = TransferError::kMaxDiagnostic);

// ════════════════════════════════════════════════════════
// Backend error classification
// ════════════════════════════════════════════════════════

enum class BackendErrorKind {
    Quota,     ///< Object-size or storage-class rejection, retrying the same part is pointless
    Transient  ///< Network or timeout class, retry in place
};

/**
 * @brief Raw failure reported by an ObjectStore
 *
 * retry_after carries a flood-wait style hint when the backend tells us how
 * long to back off; the attempter honours it instead of its linear delay.
 */
struct BackendError {
    std::string message;
    std::optional<std::chrono::milliseconds> retry_after;

    BackendError() = default;
    explicit BackendError(std::string msg,
                          std::optional<std::chrono::milliseconds> wait = std::nullopt)
        : message(std::move(msg)), retry_after(wait) {}
};

using ErrorClassifier = std::function<BackendErrorKind(const BackendError&)>;

/// "403", "413", "quota", "lfs"
std::vector<std::string> default_quota_markers();

/**
 * @brief Classifier matching any marker as a case-insensitive substring
 *
 * The transport does not return a structured taxonomy, so this is a heuristic:
 * a match means Quota, everything else is Transient.
 */
ErrorClassifier make_marker_classifier(std::vector<std::string> markers);

} // namespace relay::transfer
