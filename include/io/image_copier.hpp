#pragma once

#include "io/io.hpp"
#include "io/progress.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace isoboot {

// Largest copy buffer Run() will allocate.
inline constexpr std::uint64_t kMaxBlockSizeBytes = 1024 * 1024 * 1024ULL;

struct CopyOptions {
    std::uint64_t block_size_bytes = 4 * 1024 * 1024ULL;
    // Bytes between intermediate flushes; 0 keeps only the final flush.
    std::uint64_t fsync_interval_bytes = 64 * 1024 * 1024ULL;
    std::uint64_t progress_interval_ms = 500;
    IProgress* progress = nullptr;
    std::string label = "write";
};

struct CopyStats {
    std::uint64_t bytes_written = 0;
    double seconds = 0.0;
};

// Block copy from reader to writer. The writer is always flushed before a
// successful return; SIGINT/SIGTERM abort between blocks.
class ImageCopier {
public:
    Result Run(IReader& reader, IWriter& writer, const CopyOptions& opt, CopyStats* stats = nullptr) const;
};

} // namespace isoboot
