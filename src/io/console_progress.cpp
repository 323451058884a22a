#include "io/console_progress.hpp"

#include <cinttypes>

namespace isoboot {

namespace {
bool g_progress_line_active = false;
std::FILE* g_progress_stream = nullptr;
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const double mib = static_cast<double>(e.done) / (1024.0 * 1024.0);
    const double sec = e.elapsed_sec > 0.0 ? e.elapsed_sec : 0.001;

    if (e.total > 0) {
        double pct = 100.0 * static_cast<double>(e.done) / static_cast<double>(e.total);
        if (pct > 100.0) pct = 100.0;
        std::fprintf(stream_,
                     "\r[%.*s] %6.2f%% (%" PRIu64 "/%" PRIu64 " bytes) %.1f MiB/s",
                     (int)e.label.size(),
                     e.label.data(),
                     pct,
                     e.done,
                     e.total,
                     mib / sec);
    } else {
        std::fprintf(stream_,
                     "\r[%.*s] %" PRIu64 " bytes %.1f MiB/s",
                     (int)e.label.size(),
                     e.label.data(),
                     e.done,
                     mib / sec);
    }
    std::fflush(stream_);
    g_progress_line_active = true;
    g_progress_stream = stream_;

    if (e.final) {
        ClearProgressLine();
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active && g_progress_stream) {
        std::fprintf(g_progress_stream, "\n");
        std::fflush(g_progress_stream);
    }
    g_progress_line_active = false;
}

} // namespace isoboot
