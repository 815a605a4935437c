#include "transfer_engine.hpp"

#include <span>
#include <system_error>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"

namespace ayumi::core {

TransferEngine::TransferEngine(TransferStatus& status, const infra::Config& config)
    : status_(status), config_(config) {}

TransferEngine::~TransferEngine() {
    // Без control_mutex_: наблюдатель чанков может вызвать cancel() из потока
    if (worker_.joinable()) {
        // Незавершённая запись прерывается на границе чанка
        worker_.request_stop();
        worker_.join();
    }
}

auto TransferEngine::start(TransferRequest request) -> infra::VoidResult {
    std::lock_guard lock(control_mutex_);

    if (!status_.try_begin()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Busy,
                             "A transfer is already in progress"));
    }

    // Предыдущий поток уже записал финальный статус, осталось его дождаться
    if (worker_.joinable()) {
        worker_.join();
    }

    {
        std::lock_guard done_lock(done_mutex_);
        active_ = true;
    }

    try {
        worker_ = std::jthread([this, request = std::move(request), observer = observer_](std::stop_token st) {
            run_(st, request, observer);
        });
    } catch (const std::system_error& e) {
        status_.fail(infra::ErrorCode::Unknown, fmt::format("Cannot start transfer thread: {}", e.what()));
        mark_done_();
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown, e.what()));
    }
    return {};
}

auto TransferEngine::start(std::string_view source_path, std::string_view target_identifier)
    -> infra::VoidResult
{
    auto request = validate(source_path, device_from_identifier(target_identifier));
    if (!request) {
        return std::unexpected(std::move(request.error()));
    }
    return start(std::move(*request));
}

void TransferEngine::cancel() {
    std::lock_guard lock(control_mutex_);
    if (worker_.joinable()) {
        worker_.request_stop();
    }
}

void TransferEngine::wait() {
    std::unique_lock lock(done_mutex_);
    done_cv_.wait(lock, [this] { return !active_; });
}

void TransferEngine::set_chunk_observer(ChunkObserver observer) {
    std::lock_guard lock(control_mutex_);
    observer_ = std::move(observer);
}

void TransferEngine::mark_done_() {
    {
        std::lock_guard lock(done_mutex_);
        active_ = false;
    }
    done_cv_.notify_all();
}

void TransferEngine::run_(std::stop_token stop, const TransferRequest& request, const ChunkObserver& observer) {
    spdlog::info("Writing {} to {}", request.source_path().string(), request.target());

    infra::VoidResult result;
    try {
        result = copy_(stop, request, observer);
    } catch (const std::exception& e) {
        result = std::unexpected(infra::make_error(infra::ErrorCode::Unknown, e.what()));
    }

    if (result) {
        status_.complete();
        spdlog::info("Finished writing {} to {}", request.source_path().string(), request.target());
    } else {
        auto err = infra::log_and_return(std::move(result.error()));
        status_.fail(err.code, std::move(err.message));
    }
    mark_done_();
}

auto TransferEngine::copy_(std::stop_token stop, const TransferRequest& request,
                           const ChunkObserver& observer) -> infra::VoidResult
{
    auto source = adapters::fs::open_for_read(request.source_path());
    if (!source) {
        return std::unexpected(std::move(source.error()));
    }

    const auto destination = adapters::fs::resolve_destination(request.source_path(), request.target());
    // Цель могла стать самим образом уже после validate()
    if (adapters::fs::same_file(request.source_path(), destination.path)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::OpenError,
                             fmt::format("Destination {} is the image itself", destination.path.string())));
    }
    auto target = adapters::fs::open_for_write(destination);
    if (!target) {
        return std::unexpected(std::move(target.error()));
    }
    spdlog::debug("Destination {} ({})", destination.path.string(),
                  destination.kind == adapters::fs::TargetKind::Device ? "raw device" : "file");

    const auto total = adapters::fs::size_of(*source);
    status_.set_total(total);
    if (!total) {
        spdlog::warn("Size of {} is unknown, progress is indeterminate", request.source_path().string());
    }

    const auto chunk_size = config_.effective_chunk_size();
    std::vector<std::byte> buffer(chunk_size);
    std::uint64_t written = 0;

    for (;;) {
        auto read = adapters::fs::read_some(*source, buffer);
        if (!read) {
            return std::unexpected(std::move(read.error()));
        }
        if (*read == 0) {
            break;
        }

        // Отмена только между чанками: на носителе всегда целые чанки.
        // Конец данных проверяется раньше отмены
        if (stop.stop_requested()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Cancelled,
                                 fmt::format("Transfer cancelled after {} bytes", written)));
        }

        auto chunk = std::span<const std::byte>(buffer.data(), *read);
        if (auto res = adapters::fs::write_all(*target, chunk); !res) {
            return std::unexpected(std::move(res.error()));
        }

        written += *read;
        status_.advance(written);
        if (observer) {
            observer(written);
        }
    }

    if (config_.sync) {
        if (auto res = adapters::fs::flush(*target); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }

    if (auto res = target->close(); !res) {
        return std::unexpected(std::move(res.error()));
    }

    spdlog::debug("{} bytes written to {}", written, destination.path.string());
    return {};
}

} // namespace ayumi::core
