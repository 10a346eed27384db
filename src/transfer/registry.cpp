#include "relay/transfer/registry.hpp"

#include <spdlog/spdlog.h>

namespace relay::transfer {

// ════════════════════════════════════════════════════════
// TransferLease
// ════════════════════════════════════════════════════════

TransferLease::TransferLease(ActiveTransferRegistry* registry, std::string owner_id, std::string transfer_id)
    : registry_(registry), owner_id_(std::move(owner_id)), transfer_id_(std::move(transfer_id)) {}

TransferLease::~TransferLease() {
    release();
}

TransferLease::TransferLease(TransferLease&& other) noexcept
    : registry_(other.registry_),
      owner_id_(std::move(other.owner_id_)),
      transfer_id_(std::move(other.transfer_id_)) {
    other.registry_ = nullptr;
}

TransferLease& TransferLease::operator=(TransferLease&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = other.registry_;
        owner_id_ = std::move(other.owner_id_);
        transfer_id_ = std::move(other.transfer_id_);
        other.registry_ = nullptr;
    }
    return *this;
}

void TransferLease::release() noexcept {
    if (registry_ == nullptr) {
        return;
    }
    registry_->release(owner_id_, transfer_id_);
    registry_ = nullptr;
}

// ════════════════════════════════════════════════════════
// ActiveTransferRegistry
// ════════════════════════════════════════════════════════

std::optional<TransferLease> ActiveTransferRegistry::try_acquire(const std::string& owner_id,
                                                                 const std::string& transfer_id) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = active_.emplace(owner_id, transfer_id);
    if (!inserted) {
        spdlog::debug("[Registry] owner={} busy with transfer={}", owner_id, it->second);
        return std::nullopt;
    }
    return TransferLease(this, owner_id, transfer_id);
}

bool ActiveTransferRegistry::is_active(const std::string& owner_id) const {
    std::lock_guard lock(mutex_);
    return active_.count(owner_id) > 0;
}

std::optional<std::string> ActiveTransferRegistry::active_transfer(const std::string& owner_id) const {
    std::lock_guard lock(mutex_);
    auto it = active_.find(owner_id);
    if (it == active_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t ActiveTransferRegistry::size() const {
    std::lock_guard lock(mutex_);
    return active_.size();
}

void ActiveTransferRegistry::release(const std::string& owner_id, const std::string& transfer_id) noexcept {
    std::lock_guard lock(mutex_);
    auto it = active_.find(owner_id);
    if (it != active_.end() && it->second == transfer_id) {
        active_.erase(it);
    }
}

} // namespace relay::transfer
