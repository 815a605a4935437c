#include "transfer_status.hpp"

#include <algorithm>
#include <utility>

namespace ayumi::core {

auto to_string(TransferState state) -> std::string_view {
    switch (state) {
        case TransferState::Idle:      return "idle";
        case TransferState::Running:   return "running";
        case TransferState::Completed: return "completed";
        case TransferState::Failed:    return "failed";
        case TransferState::Cancelled: return "cancelled";
    }
    return "idle";
}

auto TransferStatus::snapshot() -> StatusSnapshot {
    std::lock_guard lock(mutex_);
    auto snap = snapshot_locked_();
    last_error_.reset();
    return snap;
}

auto TransferStatus::peek() const -> StatusSnapshot {
    std::lock_guard lock(mutex_);
    return snapshot_locked_();
}

auto TransferStatus::is_running() const -> bool {
    std::lock_guard lock(mutex_);
    return running_;
}

auto TransferStatus::try_begin() -> bool {
    std::lock_guard lock(mutex_);
    if (running_) {
        return false;
    }
    progress_ = 0.0F;
    bytes_written_ = 0;
    total_bytes_.reset();
    last_error_.reset();
    state_ = TransferState::Running;
    running_ = true;
    return true;
}

void TransferStatus::set_total(std::optional<std::uint64_t> total_bytes) {
    std::lock_guard lock(mutex_);
    total_bytes_ = total_bytes;
}

void TransferStatus::advance(std::uint64_t bytes_written) {
    std::lock_guard lock(mutex_);
    bytes_written_ = std::max(bytes_written_, bytes_written);
    if (!total_bytes_ || *total_bytes_ == 0) {
        // Размер неизвестен: прогресс остаётся на последнем значении
        return;
    }
    const auto fraction = static_cast<double>(bytes_written_) / static_cast<double>(*total_bytes_);
    const auto clamped = static_cast<float>(std::min(fraction, 1.0));
    progress_ = std::max(progress_, clamped);
}

void TransferStatus::complete() {
    std::lock_guard lock(mutex_);
    progress_ = 1.0F;
    state_ = TransferState::Completed;
    running_ = false;
}

void TransferStatus::fail(infra::ErrorCode code, std::string message) {
    std::lock_guard lock(mutex_);
    // Не больше одной ошибки на запись
    if (!running_) {
        return;
    }
    last_error_ = TransferFailure{code, std::move(message)};
    state_ = code == infra::ErrorCode::Cancelled ? TransferState::Cancelled : TransferState::Failed;
    running_ = false;
}

auto TransferStatus::snapshot_locked_() const -> StatusSnapshot {
    return StatusSnapshot{
        .progress = progress_,
        .running = running_,
        .indeterminate = running_ && !total_bytes_,
        .state = state_,
        .bytes_written = bytes_written_,
        .total_bytes = total_bytes_,
        .last_error = last_error_,
    };
}

} // namespace ayumi::core
