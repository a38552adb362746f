#include "transfer_progress.hpp"
#include <core/constants.hpp>
#include <core/format_units.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

const char* transfer_direction_name(TransferDirection dir) {
    switch (dir) {
    case TransferDirection::UPLOAD:          return "upload";
    case TransferDirection::DOWNLOAD:        return "download";
    case TransferDirection::FOLDER_DOWNLOAD: return "folder_download";
    }
    return "unknown";
}

const char* transfer_state_name(TransferState state) {
    switch (state) {
    case TransferState::NORMAL:    return "normal";
    case TransferState::CANCELLED: return "cancelled";
    case TransferState::ERROR:     return "error";
    }
    return "unknown";
}

TransferProgress::TransferProgress(uint64_t total, TransferDirection direction)
    : direction_(direction), total_(total), last_time_(Clock::now()),
      token_(std::make_shared<CancelToken>()) {}

void TransferProgress::update(uint64_t bytes_transferred) {
    update(bytes_transferred, Clock::now());
}

void TransferProgress::update(uint64_t bytes_transferred, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    transferred_ = total_ > 0 ? std::min(bytes_transferred, total_) : bytes_transferred;

    // Speed needs a positive interval; percent and ETA are refreshed regardless
    double elapsed = std::chrono::duration<double>(now - last_time_).count();
    if (elapsed > 0) {
        double delta = static_cast<double>(transferred_) - static_cast<double>(last_bytes_);
        samples_.push_back(std::max(0.0, delta / elapsed));
        while (samples_.size() > PROGRESS_SPEED_SAMPLES) samples_.pop_front();
        speed_ = std::accumulate(samples_.begin(), samples_.end(), 0.0) / samples_.size();
        last_time_ = now;
        last_bytes_ = transferred_;
    }
    recompute_locked();
}

void TransferProgress::recompute_locked() {
    if (total_ > 0) {
        double pct = static_cast<double>(transferred_) / static_cast<double>(total_) * 100.0;
        percent_ = std::min(100.0, std::round(pct * 100.0) / 100.0);
    } else {
        percent_ = 0.0;
    }
    uint64_t remaining = total_ > transferred_ ? total_ - transferred_ : 0;
    eta_ = speed_ > 0 ? static_cast<double>(remaining) / speed_ : 0.0;
}

void TransferProgress::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == TransferState::NORMAL) state_ = TransferState::CANCELLED;
    token_->cancel();
}

void TransferProgress::fail() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == TransferState::NORMAL) state_ = TransferState::ERROR;
}

void TransferProgress::set_total(uint64_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_ = total;
    if (total_ > 0) transferred_ = std::min(transferred_, total_);
    recompute_locked();
}

TransferStatus TransferProgress::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TransferStatus st;
    st.direction = direction_;
    st.state = state_;
    st.transferred = transferred_;
    st.total = total_;
    st.percent = percent_;
    st.speed = speed_;
    st.eta_seconds = eta_;
    st.speed_text = format_speed(speed_);
    st.eta_text = format_duration(eta_);
    st.transferred_text = format_size(transferred_);
    st.total_text = format_size(total_);
    return st;
}
