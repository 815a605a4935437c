#include "monitoring.hpp"
#include <fmt/core.h>
#include <iostream>
#include <algorithm>
#include <cmath>

namespace ayumi::infra {

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , quiet_(quiet)
{
    stats_.start_time = std::chrono::steady_clock::now();
}

ProgressMonitor::~ProgressMonitor() {
    if (enabled_ && rendered_) {
        render();
        std::cout << "\n"; // финальный перенос
    }
}

void ProgressMonitor::update(float fraction, std::uint64_t processed_bytes,
                             std::optional<std::uint64_t> total_bytes) {
    stats_.fraction = std::clamp(fraction, 0.0F, 1.0F);
    stats_.processed_bytes = processed_bytes;
    stats_.total_bytes = total_bytes;
}

auto ProgressMonitor::get_stats() const -> Stats {
    return stats_;
}

void ProgressMonitor::render() const {
    if (quiet_ || !enabled_) return;

    // Очистка строки и вывод
    std::cout << "\r\033[K"; // ANSI: очистить строку
    std::cout << format_line(stats_, std::chrono::steady_clock::now()) << std::flush;
    rendered_ = true;
}

auto ProgressMonitor::format_line(const Stats& stats,
                                  std::chrono::steady_clock::time_point now) -> std::string {
    const int bar_width = 20;
    const int filled = static_cast<int>(stats.fraction * bar_width);

    // Скорость (байт/сек)
    auto elapsed_sec = std::chrono::duration<double>(now - stats.start_time).count();
    double bytes_per_sec = elapsed_sec > 0 ? stats.processed_bytes / elapsed_sec : 0.0;

    // ETA
    double eta_sec = 0.0;
    if (stats.total_bytes && bytes_per_sec > 0 && stats.processed_bytes > 0
        && *stats.total_bytes > stats.processed_bytes) {
        double remaining_bytes = static_cast<double>(*stats.total_bytes - stats.processed_bytes);
        eta_sec = remaining_bytes / bytes_per_sec;
    }

    // Форматирование скорости
    const char* unit = "B/s";
    double speed = bytes_per_sec;
    if (speed > 1024*1024*1024) { speed /= 1024*1024*1024; unit = "GB/s"; }
    else if (speed > 1024*1024) { speed /= 1024*1024; unit = "MB/s"; }
    else if (speed > 1024) { speed /= 1024; unit = "KB/s"; }

    // Форматирование ETA
    std::string eta_str = stats.total_bytes ? "--:--" : "inf";
    if (std::isfinite(eta_sec) && eta_sec > 0) {
        int seconds = static_cast<int>(eta_sec);
        int hours = seconds / 3600;
        int minutes = (seconds % 3600) / 60;
        seconds = seconds % 60;
        if (hours > 0) {
            eta_str = fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
        } else {
            eta_str = fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    // Без известного размера показываем только объём
    const auto percent = stats.total_bytes ? fmt::format("{:5.1f}%", stats.fraction * 100.0F) : std::string("  ?  ");
    return fmt::format(
        "[{}] {} | {:.1f} {} | ETA: {} | {:.1f} MB",
        bar,
        percent,
        speed, unit,
        eta_str,
        stats.processed_bytes / 1024.0 / 1024.0
    );
}

} // namespace ayumi::infra
