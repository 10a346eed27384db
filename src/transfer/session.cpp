#include "relay/transfer/session.hpp"

namespace relay::transfer {
namespace {

bool is_progressive(TransferState current, TransferState target) {
    switch (current) {
        case TransferState::Pending:
            return target == TransferState::Downloading;
        case TransferState::Downloading:
            return target == TransferState::Strategizing || target == TransferState::Failed;
        case TransferState::Strategizing:
            return target == TransferState::Uploading;
        case TransferState::Uploading:
            return target == TransferState::Finalizing || target == TransferState::Failed;
        case TransferState::Finalizing:
            return target == TransferState::Done || target == TransferState::Failed;
        case TransferState::Done:
        case TransferState::Failed:
            return false;
    }
    return false;
}

} // namespace

const char* to_string(TransferState state) noexcept {
    switch (state) {
        case TransferState::Pending: return "pending";
        case TransferState::Downloading: return "downloading";
        case TransferState::Strategizing: return "strategizing";
        case TransferState::Uploading: return "uploading";
        case TransferState::Finalizing: return "finalizing";
        case TransferState::Done: return "done";
        case TransferState::Failed: return "failed";
    }
    return "unknown";
}

TransferSession::TransferSession(std::string transfer_id, std::string owner_id,
                                 std::string object_name, std::string target_namespace) {
    info_.transfer_id = std::move(transfer_id);
    info_.owner_id = std::move(owner_id);
    info_.object_name = std::move(object_name);
    info_.target_namespace = std::move(target_namespace);
    info_.state = TransferState::Pending;
    info_.started_at = std::chrono::system_clock::now();
    last_transition_ = info_.started_at;
}

relay::Result<void> TransferSession::transition_to(TransferState next_state) {
    if (info_.state == next_state) {
        return relay::Ok();
    }

    if (!can_transition(next_state)) {
        return relay::Err<void>(std::string("Illegal transfer state transition ") + to_string(info_.state) +
                                " -> " + to_string(next_state));
    }

    info_.state = next_state;
    last_transition_ = std::chrono::system_clock::now();
    if (next_state != TransferState::Failed) {
        info_.last_error.clear();
    }
    return relay::Ok();
}

relay::Result<void> TransferSession::mark_failed(std::string error_message) {
    auto result = transition_to(TransferState::Failed);
    if (result.is_ok()) {
        info_.last_error = std::move(error_message);
    }
    return result;
}

bool TransferSession::can_transition(TransferState target) const noexcept {
    return is_progressive(info_.state, target);
}

} // namespace relay::transfer
