#pragma once

#include <atomic>
#include <csignal>

namespace ayumi::infra {

extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

} // namespace ayumi::infra
