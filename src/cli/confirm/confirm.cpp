#include "confirm.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <fmt/core.h>

namespace ayumi::cli {

auto confirm_transfer(const core::TransferRequest& request,
                      std::istream& in,
                      std::ostream& out) -> bool
{
    out << fmt::format("Image:  {}\n", request.source_path().string());
    out << fmt::format("Target: {}", request.target());
    if (request.target_label() != request.target()) {
        out << fmt::format(" [{}]", request.target_label());
    }
    out << "\n";
    if (request.target_kind() == core::DeviceKind::RawDevice) {
        out << "ALL DATA ON THE TARGET WILL BE OVERWRITTEN.\n";
    }
    out << "Type 'yes' to continue: " << std::flush;

    std::string answer;
    if (!std::getline(in, answer)) {
        out << "\n";
        return false;
    }
    // Пробелы по краям прощаем, но не регистр
    const auto first = answer.find_first_not_of(" \t\r");
    const auto last = answer.find_last_not_of(" \t\r");
    if (first == std::string::npos) {
        return false;
    }
    return answer.substr(first, last - first + 1) == "yes";
}

} // namespace ayumi::cli
