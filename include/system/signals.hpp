#pragma once

#include <atomic>
#include <csignal>

namespace isoboot {

// Set by SIGINT/SIGTERM while a ScopedSignalCancel is alive.
extern std::atomic_bool g_cancel;

// Routes SIGINT/SIGTERM into g_cancel for its lifetime so a long copy can
// stop between blocks; outside of it the default handlers terminate as usual
// (an operator pressing Ctrl-C at a prompt expects the tool to quit).
class ScopedSignalCancel {
public:
    ScopedSignalCancel();
    ~ScopedSignalCancel();

    ScopedSignalCancel(const ScopedSignalCancel&) = delete;
    ScopedSignalCancel& operator=(const ScopedSignalCancel&) = delete;

private:
    struct sigaction prev_int_{};
    struct sigaction prev_term_{};
};

} // namespace isoboot
