#include "util/config_json_utils.hpp"

#include "io/image_copier.hpp"

#include <fstream>
#include <regex>

namespace isoboot::config::detail {

namespace {

// Each reader leaves |out| untouched when the key is absent and fails only
// when the key is present with the wrong type.

bool ReadString(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool ReadU64(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (!it->is_number_integer()) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, Config& cfg, std::string& err) {
    if (!ReadString(j, "SystemDisk", cfg.system_disk, err)) return false;
    if (!ReadString(j, "DevicePattern", cfg.device_pattern, err)) return false;
    if (!ReadString(j, "ImageExtension", cfg.image_extension, err)) return false;
    if (!ReadString(j, "DownloadDir", cfg.download_dir, err)) return false;
    if (!ReadString(j, "MountTable", cfg.mount_table, err)) return false;
    if (!ReadU64(j, "BlockSizeBytes", cfg.block_size_bytes, err)) return false;
    if (!ReadU64(j, "FsyncIntervalBytes", cfg.fsync_interval_bytes, err)) return false;

    if (cfg.system_disk.empty()) {
        err = "SystemDisk must not be empty";
        return false;
    }
    if (cfg.image_extension.empty()) {
        err = "ImageExtension must not be empty";
        return false;
    }
    if (cfg.download_dir.empty()) {
        err = "DownloadDir must not be empty";
        return false;
    }
    if (cfg.block_size_bytes == 0) {
        err = "BlockSizeBytes must be greater than zero";
        return false;
    }
    if (cfg.block_size_bytes > kMaxBlockSizeBytes) {
        err = "BlockSizeBytes must not exceed " + std::to_string(kMaxBlockSizeBytes);
        return false;
    }

    try {
        std::regex probe(cfg.device_pattern);
    } catch (const std::regex_error& e) {
        err = "DevicePattern is not a valid regular expression: " + std::string(e.what());
        return false;
    }

    {
        std::string backend;
        if (!ReadString(j, "WriteBackend", backend, err)) return false;
        if (!backend.empty()) {
            auto parsed = ParseWriteBackend(backend);
            if (!parsed) {
                err = "WriteBackend must be one of auto, dd, direct (got: " + backend + ")";
                return false;
            }
            cfg.write_backend = *parsed;
        }
    }
    {
        std::string level;
        if (!ReadString(j, "LogLevel", level, err)) return false;
        if (!level.empty()) {
            auto parsed = ParseLogLevel(level);
            if (!parsed) {
                err = "LogLevel must be one of debug, info, warn, error, none (got: " + level + ")";
                return false;
            }
            cfg.log_level = *parsed;
        }
    }

    return true;
}

} // namespace isoboot::config::detail
