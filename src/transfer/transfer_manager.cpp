#include "transfer_manager.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

TransferManager::TransferManager(size_t cancelled_history)
    : cancelled_history_(cancelled_history) {}

std::shared_ptr<TransferProgress> TransferManager::create_transfer(const std::string& transfer_id,
                                                                   uint64_t total,
                                                                   TransferDirection direction) {
    auto progress = std::make_shared<TransferProgress>(total, direction);
    std::lock_guard<std::mutex> lock(mutex_);
    transfers_[transfer_id] = progress;
    cancel_flags_[transfer_id] = false;
    forget_cancelled_locked(transfer_id);
    return progress;
}

std::shared_ptr<TransferProgress> TransferManager::get_transfer(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(transfer_id);
    return it == transfers_.end() ? nullptr : it->second;
}

bool TransferManager::cancel_transfer(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) return false;
    it->second->cancel();
    cancel_flags_[transfer_id] = true;
    log_info(fmt::format("Transfer {} cancelled", transfer_id));
    return true;
}

bool TransferManager::is_cancelled(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cancel_flags_.find(transfer_id);
    if (it != cancel_flags_.end() && it->second) return true;
    return cancelled_.count(transfer_id) > 0;
}

void TransferManager::remove_transfer(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        cancel_flags_.erase(transfer_id);
        return;
    }

    bool cancelled = it->second->is_cancelled();
    if (cancelled) {
        TransferStatus final_status = it->second->get_status();
        final_status.state = TransferState::CANCELLED;
        forget_cancelled_locked(transfer_id);
        cancelled_[transfer_id] = final_status;
        cancelled_order_.push_back(transfer_id);
        while (cancelled_order_.size() > cancelled_history_) {
            cancelled_.erase(cancelled_order_.front());
            cancelled_order_.pop_front();
        }
    }
    transfers_.erase(it);
    cancel_flags_.erase(transfer_id);
}

std::optional<TransferStatus> TransferManager::status(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(transfer_id);
    if (it != transfers_.end()) return it->second->get_status();
    auto c = cancelled_.find(transfer_id);
    if (c != cancelled_.end()) return c->second;
    return std::nullopt;
}

size_t TransferManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.size();
}

void TransferManager::forget_cancelled_locked(const std::string& transfer_id) {
    if (cancelled_.erase(transfer_id) == 0) return;
    cancelled_order_.erase(std::remove(cancelled_order_.begin(), cancelled_order_.end(), transfer_id),
                           cancelled_order_.end());
}
