#include "io/image_copier.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <new>
#include <string>
#include <vector>

namespace isoboot {

namespace {

std::uint64_t NowMs() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

void Emit(const CopyOptions& opt, std::uint64_t done, std::uint64_t total, std::uint64_t t0, bool final) {
    if (!opt.progress) return;
    ProgressEvent e{};
    e.label = opt.label;
    e.done = done;
    e.total = total;
    e.elapsed_sec = static_cast<double>(NowMs() - t0) / 1000.0;
    e.final = final;
    opt.progress->OnProgress(e);
}

} // namespace

Result ImageCopier::Run(IReader& reader, IWriter& writer, const CopyOptions& opt, CopyStats* stats) const {
    if (opt.block_size_bytes == 0) {
        return Result::Io(EINVAL, "block size must be greater than zero");
    }
    if (opt.block_size_bytes > kMaxBlockSizeBytes) {
        return Result::Io(EINVAL,
                          "block size " + std::to_string(opt.block_size_bytes) + " exceeds " +
                              std::to_string(kMaxBlockSizeBytes) + " bytes");
    }

    std::vector<std::uint8_t> buf;
    try {
        buf.resize(static_cast<size_t>(opt.block_size_bytes));
    } catch (const std::bad_alloc&) {
        return Result::Io(ENOMEM,
                          "cannot allocate " + std::to_string(opt.block_size_bytes) + " byte copy buffer");
    }

    const std::uint64_t total = reader.TotalSize().value_or(0);
    std::uint64_t written = 0;
    std::uint64_t unsynced = 0;

    const std::uint64_t t0 = NowMs();
    std::uint64_t last_emit = t0;

    while (true) {
        if (g_cancel.load(std::memory_order_relaxed)) {
            LogWarn("Copy interrupted after %llu bytes", (unsigned long long)written);
            return Result::Io(ECANCELED, "Interrupted after " + std::to_string(written) + " bytes");
        }

        ssize_t n = reader.Read(buf);
        if (n == 0) break;
        if (n < 0) {
            return Result::Io(errno, "Read failed (" + std::string(std::strerror(errno)) + ")");
        }

        auto wr = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.is_ok()) return wr;

        written += static_cast<std::uint64_t>(n);

        if (opt.fsync_interval_bytes != 0) {
            unsynced += static_cast<std::uint64_t>(n);
            if (unsynced >= opt.fsync_interval_bytes) {
                auto fs = writer.Flush();
                if (!fs.is_ok()) return fs;
                LogDebug("flushed at %llu bytes", (unsigned long long)written);
                unsynced = 0;
            }
        }

        const std::uint64_t now = NowMs();
        if (now - last_emit >= opt.progress_interval_ms) {
            Emit(opt, written, total, t0, false);
            last_emit = now;
        }
    }

    auto fs = writer.Flush();
    if (!fs.is_ok()) return fs;

    Emit(opt, written, total, t0, true);

    double sec = static_cast<double>(NowMs() - t0) / 1000.0;
    if (sec <= 0.0) sec = 0.001;
    LogInfo("Copied %llu bytes in %.2fs (%.2f MiB/s)",
            (unsigned long long)written,
            sec,
            (static_cast<double>(written) / (1024.0 * 1024.0)) / sec);

    if (stats) {
        stats->bytes_written = written;
        stats->seconds = sec;
    }
    return Result::Ok();
}

} // namespace isoboot
