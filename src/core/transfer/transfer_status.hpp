#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace ayumi::core {

enum class TransferState {
    Idle,
    Running,
    Completed,
    Failed,
    Cancelled,
};

[[nodiscard]] auto to_string(TransferState state) -> std::string_view;

struct TransferFailure {
    infra::ErrorCode code;
    std::string message;
};

struct StatusSnapshot {
    float progress = 0.0F;
    bool running = false;
    bool indeterminate = false;           // общий размер неизвестен
    TransferState state = TransferState::Idle;
    std::uint64_t bytes_written = 0;
    std::optional<std::uint64_t> total_bytes;
    std::optional<TransferFailure> last_error;
};

/// Общее состояние текущей записи.
///
/// Пишет только работающий TransferEngine, читают все остальные. Все поля
/// защищены одним мьютексом как единый агрегат: читатель никогда не увидит
/// running=false раньше финального прогресса или ошибки этой записи.
/// Объект живёт всё время работы процесса и передаётся по ссылке.
class TransferStatus {
public:
    TransferStatus() = default;

    TransferStatus(const TransferStatus&) = delete;
    TransferStatus& operator=(const TransferStatus&) = delete;

    /// Снимок состояния для опроса. last_error при этом забирается:
    /// каждая ошибка показывается ровно один раз.
    [[nodiscard]] auto snapshot() -> StatusSnapshot;

    /// Снимок без изъятия ошибки.
    [[nodiscard]] auto peek() const -> StatusSnapshot;

    [[nodiscard]] auto is_running() const -> bool;

    // ---- Только для TransferEngine ----

    /// Атомарно: сброс прогресса, очистка ошибки, running=true.
    /// Возвращает false, если запись уже идёт.
    [[nodiscard]] auto try_begin() -> bool;

    void set_total(std::optional<std::uint64_t> total_bytes);

    /// Учитывает записанные байты; прогресс только растёт и не превышает 1.0.
    void advance(std::uint64_t bytes_written);

    void complete();

    void fail(infra::ErrorCode code, std::string message);

private:
    [[nodiscard]] auto snapshot_locked_() const -> StatusSnapshot;

    mutable std::mutex mutex_;
    float progress_ = 0.0F;
    bool running_ = false;
    TransferState state_ = TransferState::Idle;
    std::uint64_t bytes_written_ = 0;
    std::optional<std::uint64_t> total_bytes_;
    std::optional<TransferFailure> last_error_;
};

} // namespace ayumi::core
