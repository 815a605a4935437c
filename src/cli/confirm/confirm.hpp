#pragma once

#include <iosfwd>
#include "core/transfer/transfer_request.hpp"

namespace ayumi::cli {

/// Спрашивает подтверждение перед необратимой записью.
///
/// Показывает точный путь образа и идентификатор цели и принимает только
/// явный ответ "yes". Любой другой ответ или конец ввода: отказ.
/// Движок подтверждение не повторяет: без этого шага start() не вызывается.
[[nodiscard]] auto confirm_transfer(const core::TransferRequest& request,
                                    std::istream& in,
                                    std::ostream& out) -> bool;

} // namespace ayumi::cli
