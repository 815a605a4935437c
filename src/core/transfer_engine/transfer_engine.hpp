#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string_view>
#include <thread>
#include "core/transfer/transfer_request.hpp"
#include "core/transfer/transfer_status.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"

namespace ayumi::core {

/// Выполняет запись образа в фоновом потоке.
///
/// Состояния: Idle -> Running -> {Completed, Failed, Cancelled}. Одновременно
/// идёт не больше одной записи; повторный start() во время работы отклоняется
/// с ErrorCode::Busy и не трогает текущее состояние. После завершения движок
/// можно запускать снова.
///
/// Ошибки передачи не выходят из фонового потока исключением: они попадают
/// в TransferStatus. Зависание вызова ввода-вывода на устройстве блокирует
/// фоновый поток без ограничения по времени.
///
/// status и config должны жить дольше движка.
class TransferEngine {
public:
    /// Вызывается в фоновом потоке после записи каждого чанка.
    using ChunkObserver = std::function<void(std::uint64_t bytes_written)>;

    TransferEngine(TransferStatus& status, const infra::Config& config);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /// Запускает запись и сразу возвращается.
    [[nodiscard]] auto start(TransferRequest request) -> infra::VoidResult;

    /// validate() + start() одним вызовом; ошибки валидации возвращаются
    /// синхронно, до создания потока.
    [[nodiscard]] auto start(std::string_view source_path, std::string_view target_identifier)
        -> infra::VoidResult;

    /// Кооперативная отмена: проверяется между чанками, чанк не прерывается.
    void cancel();

    /// Блокирует до завершения текущей записи (если она есть).
    void wait();

    /// Действует начиная со следующего start().
    void set_chunk_observer(ChunkObserver observer);

private:
    void run_(std::stop_token stop, const TransferRequest& request, const ChunkObserver& observer);
    [[nodiscard]] auto copy_(std::stop_token stop, const TransferRequest& request,
                             const ChunkObserver& observer) -> infra::VoidResult;
    void mark_done_();

    TransferStatus& status_;
    const infra::Config& config_;
    ChunkObserver observer_;

    // Порядок захвата: control_mutex_ -> done_mutex_. Фоновый поток берёт
    // только done_mutex_, поэтому join() под control_mutex_ безопасен.
    std::mutex control_mutex_;
    std::mutex done_mutex_;
    std::condition_variable done_cv_;
    bool active_ = false;

    std::jthread worker_;
};

} // namespace ayumi::core
