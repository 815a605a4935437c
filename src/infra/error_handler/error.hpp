#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace ayumi::infra {

enum class ErrorCode {
    // Ошибки валидации (синхронные, до запуска фонового потока)
    EmptySource,
    EmptyTarget,
    SourceUnreadable,
    TargetTooSmall,
    TargetIsSource,

    // Движок уже занят другой записью
    Busy,

    // Ошибки передачи (только внутри фонового потока)
    OpenError,
    ReadError,
    WriteError,
    Cancelled,

    // Прочие
    InvalidConfig,
    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_validation() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

// Вспомогательные функции-конструкторы
[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Ошибка ОС: сообщение дополняется текстом системной ошибки как есть.
[[nodiscard]] auto make_os_error(
    ErrorCode code,
    std::string_view context,
    std::error_code ec,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace ayumi::infra
