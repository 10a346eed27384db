#pragma once

#include "relay/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace relay::transfer {

enum class TransferState {
    Pending,
    Downloading,
    Strategizing,
    Uploading,
    Finalizing,
    Done,
    Failed
};

const char* to_string(TransferState state) noexcept;

/**
 * @brief Snapshot of one transfer
 */
struct TransferInfo {
    std::string transfer_id;
    std::string owner_id;
    std::string object_name;
    std::string target_namespace;
    TransferState state = TransferState::Pending;
    std::uint64_t total_bytes = 0;   ///< Known once downloading completes
    std::string strategy;            ///< Empty until Strategizing
    std::chrono::system_clock::time_point started_at{};
    std::string last_error;          ///< Populated when state == Failed
};

/**
 * @brief Transfer state machine
 *
 * Pending -> Downloading -> Strategizing -> Uploading -> Finalizing -> Done.
 * Downloading, Uploading and Finalizing may also move to Failed. Done and
 * Failed are terminal.
 */
class TransferSession {
public:
    TransferSession(std::string transfer_id, std::string owner_id,
                    std::string object_name, std::string target_namespace);

    [[nodiscard]] const std::string& transfer_id() const noexcept { return info_.transfer_id; }
    [[nodiscard]] TransferState state() const noexcept { return info_.state; }
    [[nodiscard]] const TransferInfo& info() const noexcept { return info_; }

    relay::Result<void> transition_to(TransferState next_state);
    relay::Result<void> mark_failed(std::string error_message);

    void set_total_bytes(std::uint64_t bytes) noexcept { info_.total_bytes = bytes; }
    void set_strategy(std::string strategy) { info_.strategy = std::move(strategy); }

    [[nodiscard]] bool terminal() const noexcept {
        return info_.state == TransferState::Done || info_.state == TransferState::Failed;
    }

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(TransferState target) const noexcept;

    TransferInfo info_;
    std::chrono::system_clock::time_point last_transition_{};
};

} // namespace relay::transfer
