#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

enum class TransferDirection { UPLOAD, DOWNLOAD, FOLDER_DOWNLOAD };
enum class TransferState { NORMAL, CANCELLED, ERROR };

const char* transfer_direction_name(TransferDirection dir);
const char* transfer_state_name(TransferState state);

// Shared cancellation signal. Copy loops hold one and poll it per quantum.
class CancelToken {
public:
    void cancel() { flag_.store(true); }
    bool cancelled() const { return flag_.load(); }

private:
    std::atomic<bool> flag_{false};
};

// Point-in-time snapshot returned by get_status().
struct TransferStatus {
    TransferDirection direction = TransferDirection::UPLOAD;
    TransferState state = TransferState::NORMAL;
    uint64_t transferred = 0;
    uint64_t total = 0;
    double percent = 0.0;          // 0..100, two decimals
    double speed = 0.0;            // bytes/s, mean of recent samples
    double eta_seconds = 0.0;

    std::string speed_text;        // "1.50 MB/s"
    std::string eta_text;          // "5m 30s"
    std::string transferred_text;  // "12.00 MB"
    std::string total_text;
};

// Byte counter for one transfer with smoothed speed and ETA.
class TransferProgress {
public:
    using Clock = std::chrono::steady_clock;

    TransferProgress(uint64_t total, TransferDirection direction);

    // Record the absolute number of bytes moved so far.
    void update(uint64_t bytes_transferred);
    void update(uint64_t bytes_transferred, Clock::time_point now);

    // NORMAL -> CANCELLED and raise the token. No effect once ERROR.
    void cancel();
    // NORMAL -> ERROR.
    void fail();

    bool is_cancelled() const { return token_->cancelled(); }
    std::shared_ptr<CancelToken> token() const { return token_; }

    void set_total(uint64_t total);
    TransferStatus get_status() const;

private:
    mutable std::mutex mutex_;
    const TransferDirection direction_;
    uint64_t total_;
    uint64_t transferred_ = 0;
    uint64_t last_bytes_ = 0;
    Clock::time_point last_time_;
    std::deque<double> samples_;
    double speed_ = 0.0;
    double percent_ = 0.0;
    double eta_ = 0.0;
    TransferState state_ = TransferState::NORMAL;
    std::shared_ptr<CancelToken> token_;

    void recompute_locked();
};
