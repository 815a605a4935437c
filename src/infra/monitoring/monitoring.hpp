#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ayumi::infra {

/// Строка прогресса в терминале.
/// Не владеет потоком: перерисовывается вызывающим циклом опроса.
class ProgressMonitor {
public:
    struct Stats {
        float fraction = 0.0F;
        std::uint64_t processed_bytes = 0;
        std::optional<std::uint64_t> total_bytes;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void update(float fraction, std::uint64_t processed_bytes, std::optional<std::uint64_t> total_bytes);
    void render() const;

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    /// Текст строки без управляющих последовательностей терминала.
    [[nodiscard]] static auto format_line(const Stats& stats,
                                          std::chrono::steady_clock::time_point now) -> std::string;

private:
    Stats stats_;
    const bool enabled_;
    const bool quiet_;
    mutable bool rendered_ = false;
};

} // namespace ayumi::infra
