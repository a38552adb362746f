#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "transfer_progress.hpp"

// Registry of in-flight transfers and the single source of truth for
// whether a transfer is still wanted.
//
// Cancellation outlives the progress entry: once a cancelled transfer is
// removed, its id stays recognisable (and its final snapshot queryable) in a
// bounded FIFO so late chunks and progress polls still see `cancelled`.
class TransferManager {
public:
    explicit TransferManager(size_t cancelled_history = 256);

    // Call once per transfer id. Re-creating an id starts a fresh transfer.
    std::shared_ptr<TransferProgress> create_transfer(const std::string& transfer_id,
                                                      uint64_t total,
                                                      TransferDirection direction);
    std::shared_ptr<TransferProgress> get_transfer(const std::string& transfer_id) const;

    // True if a live transfer was found and flagged.
    bool cancel_transfer(const std::string& transfer_id);
    bool is_cancelled(const std::string& transfer_id) const;

    void remove_transfer(const std::string& transfer_id);

    // Live snapshot, or the final snapshot of a cancelled transfer.
    std::optional<TransferStatus> status(const std::string& transfer_id) const;

    size_t active_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<TransferProgress>> transfers_;
    std::map<std::string, bool> cancel_flags_;
    std::map<std::string, TransferStatus> cancelled_;
    std::deque<std::string> cancelled_order_;
    size_t cancelled_history_;

    void forget_cancelled_locked(const std::string& transfer_id);
};
