#include "error.hpp"
#include <fmt/core.h>
#include <cstdlib>

namespace ayumi::infra {

bool Error::is_validation() const {
    switch (code) {
        case ErrorCode::EmptySource:
        case ErrorCode::EmptyTarget:
        case ErrorCode::SourceUnreadable:
        case ErrorCode::TargetTooSmall:
        case ErrorCode::TargetIsSource:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::WriteError:     return 20;
        case ErrorCode::OpenError:      return 21;
        case ErrorCode::ReadError:      return 22;
        case ErrorCode::Cancelled:      return 130; // SIGINT
        default:                        return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::EmptySource:      return "EmptySource";
        case ErrorCode::EmptyTarget:      return "EmptyTarget";
        case ErrorCode::SourceUnreadable: return "SourceUnreadable";
        case ErrorCode::TargetTooSmall:   return "TargetTooSmall";
        case ErrorCode::TargetIsSource:   return "TargetIsSource";
        case ErrorCode::Busy:             return "Busy";
        case ErrorCode::OpenError:        return "OpenError";
        case ErrorCode::ReadError:        return "ReadError";
        case ErrorCode::WriteError:       return "WriteError";
        case ErrorCode::Cancelled:        return "Cancelled";
        case ErrorCode::InvalidConfig:    return "InvalidConfig";
        case ErrorCode::Unknown:          return "Unknown";
    }
    return "Unknown";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error make_os_error(ErrorCode code, std::string_view context, std::error_code ec,
                    const std::source_location& loc) {
    return Error{code, fmt::format("{}: {}", context, ec.message()), loc};
}

Error log_and_return(Error&& err) {
    // Отмена пользователем и ошибки валидации не являются сбоем программы
    auto level = (err.code == ErrorCode::Cancelled || err.is_validation())
        ? spdlog::level::warn
        : spdlog::level::err;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace ayumi::infra
