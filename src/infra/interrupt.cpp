#include "interrupt.hpp"

namespace ayumi::infra {

std::atomic<bool> g_interrupted{false};

// Только async-signal-safe операции: запись в lock-free atomic.
// Сообщение о прерывании пишет цикл опроса, а не обработчик.
extern "C" void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace ayumi::infra
