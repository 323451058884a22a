#pragma once

#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace isoboot {

inline constexpr const char* kDefaultConfigPath = "/etc/isoboot/isoboot.json";
inline constexpr const char* kConfigPathEnv = "ISOBOOT_CONFIG";
inline constexpr const char* kLogLevelEnv = "ISOBOOT_LOG_LEVEL";

enum class WriteBackend {
    Auto,   // Direct when running as root, Dd otherwise
    Dd,     // external dd, elevated through sudo when needed
    Direct, // in-process copy, root only
};

std::optional<WriteBackend> ParseWriteBackend(std::string_view s);
const char* ToString(WriteBackend backend);

// Direct requires root; asking for it without root falls back to Dd.
WriteBackend ResolveWriteBackend(WriteBackend configured, bool is_root);

struct Config {
    std::string system_disk = "/dev/sda";
    std::string device_pattern = "^/dev/sd[a-z]$";
    std::string image_extension = ".iso";
    std::string download_dir = "~/Downloads";
    std::uint64_t block_size_bytes = 4 * 1024 * 1024ULL;
    std::uint64_t fsync_interval_bytes = 64 * 1024 * 1024ULL;
    WriteBackend write_backend = WriteBackend::Auto;
    std::string mount_table = "/proc/self/mounts";
    std::optional<LogLevel> log_level;

    // Replaces |out| with defaults overlaid by the file's keys. On failure
    // |out| holds plain defaults.
    static Result LoadFromFile(const std::string& path, Config& out);
};

// $ISOBOOT_CONFIG when set and non-empty, kDefaultConfigPath otherwise.
std::string ConfigPathFromEnvironment(const EnvLookup& env);

} // namespace isoboot
