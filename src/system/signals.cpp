// signals.cpp - Signal handling and shared cancel flag.

#include "system/signals.hpp"

namespace isoboot {

std::atomic_bool g_cancel{false};

static void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

ScopedSignalCancel::ScopedSignalCancel() {
    g_cancel.store(false, std::memory_order_relaxed);

    struct sigaction sa{};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    ::sigaction(SIGINT, &sa, &prev_int_);
    ::sigaction(SIGTERM, &sa, &prev_term_);
}

ScopedSignalCancel::~ScopedSignalCancel() {
    ::sigaction(SIGINT, &prev_int_, nullptr);
    ::sigaction(SIGTERM, &prev_term_, nullptr);
}

} // namespace isoboot
