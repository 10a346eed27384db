#include "relay/transfer/errors.hpp"

#include <algorithm>
#include <cctype>

namespace relay::transfer {
namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

} // namespace

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::SourceRead: return "SourceReadError";
        case ErrorKind::BackendQuota: return "BackendQuotaError";
        case ErrorKind::BackendTransient: return "BackendTransientError";
        case ErrorKind::LadderExhausted: return "LadderExhaustedError";
        case ErrorKind::SizeLimitExceeded: return "SizeLimitExceededError";
        case ErrorKind::Busy: return "Busy";
        case ErrorKind::LocalIo: return "LocalIoError";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

TransferError::TransferError(ErrorKind k, std::string diagnostic)
    : kind(k), message(truncate_diagnostic(std::move(diagnostic))) {}

std::string TransferError::user_message() const {
    std::string text;
    switch (kind) {
        case ErrorKind::LadderExhausted:
            text = "The backend rejected the object even at the smallest chunk size (probable cause: size limit). "
                   "Reduce the object size or choose a namespace with a larger storage class.";
            break;
        case ErrorKind::BackendQuota:
            text = "The backend refused the upload (probable cause: quota or permissions).";
            break;
        case ErrorKind::BackendTransient:
            text = "Upload failed after retries (probable cause: network).";
            break;
        case ErrorKind::SizeLimitExceeded:
            text = "The object exceeds the maximum size this relay accepts.";
            break;
        case ErrorKind::SourceRead:
            text = "Downloading the object from the source failed.";
            break;
        case ErrorKind::Busy:
            text = "A transfer for this owner is already running. Wait for it to finish.";
            break;
        case ErrorKind::LocalIo:
            text = "Local staging storage failed.";
            break;
        case ErrorKind::InvalidRequest:
        case ErrorKind::InvalidConfig:
            text = "The transfer request is invalid.";
            break;
    }
    if (!message.empty()) {
        text += " Details: " + message;
    }
    return text;
}

std::string truncate_diagnostic(std::string text, std::size_t max_length) {
    if (text.size() > max_length) {
        text.resize(max_length);
        text += "...";
    }
    return text;
}

std::vector<std::string> default_quota_markers() {
    return {"403", "413", "quota", "lfs"};
}

ErrorClassifier make_marker_classifier(std::vector<std::string> markers) {
    for (auto& marker : markers) {
        marker = to_lower(std::move(marker));
    }
    return [markers = std::move(markers)](const BackendError& error) {
        const auto haystack = to_lower(error.message);
        for (const auto& marker : markers) {
            if (!marker.empty() && haystack.find(marker) != std::string::npos) {
                return BackendErrorKind::Quota;
            }
        }
        return BackendErrorKind::Transient;
    };
}

} // namespace relay::transfer
