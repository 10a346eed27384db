#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace relay::transfer {

class ActiveTransferRegistry;

/**
 * @brief Proof that an owner is registered; deregisters on destruction
 *
 * Move-only. Whatever path a transfer takes out (success, failure, exception)
 * the owner is released exactly once.
 */
class TransferLease {
public:
    TransferLease() = default;
    ~TransferLease();

    TransferLease(const TransferLease&) = delete;
    TransferLease& operator=(const TransferLease&) = delete;
    TransferLease(TransferLease&& other) noexcept;
    TransferLease& operator=(TransferLease&& other) noexcept;

    [[nodiscard]] bool active() const noexcept { return registry_ != nullptr; }
    [[nodiscard]] const std::string& owner_id() const noexcept { return owner_id_; }
    [[nodiscard]] const std::string& transfer_id() const noexcept { return transfer_id_; }

    /// Deregister now instead of at destruction
    void release() noexcept;

private:
    friend class ActiveTransferRegistry;
    TransferLease(ActiveTransferRegistry* registry, std::string owner_id, std::string transfer_id);

    ActiveTransferRegistry* registry_ = nullptr;
    std::string owner_id_;
    std::string transfer_id_;
};

/**
 * @brief owner id -> active transfer id
 *
 * try_acquire() is a single check-and-set under the registry mutex, so two
 * requests for the same owner can never both see "not busy".
 */
class ActiveTransferRegistry {
public:
    ActiveTransferRegistry() = default;

    ActiveTransferRegistry(const ActiveTransferRegistry&) = delete;
    ActiveTransferRegistry& operator=(const ActiveTransferRegistry&) = delete;

    /// nullopt when the owner already has an active transfer
    std::optional<TransferLease> try_acquire(const std::string& owner_id, const std::string& transfer_id);

    [[nodiscard]] bool is_active(const std::string& owner_id) const;
    [[nodiscard]] std::optional<std::string> active_transfer(const std::string& owner_id) const;
    [[nodiscard]] std::size_t size() const;

private:
    friend class TransferLease;
    void release(const std::string& owner_id, const std::string& transfer_id) noexcept;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> active_;
};

} // namespace relay::transfer
