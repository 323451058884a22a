#pragma once

#include "util/config.hpp"
#include "util/path_utils.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace isoboot {

struct WriteRequest {
    std::string image_path;
    std::string device_path;
    WriteBackend backend = WriteBackend::Dd; // already resolved, never Auto
    std::uint64_t block_size_bytes = 4 * 1024 * 1024ULL;
    std::uint64_t fsync_interval_bytes = 64 * 1024 * 1024ULL;
};

// Every operating-system collaborator the tool touches. Callers only ever
// see a Result; raw exit statuses stay behind this seam.
class ISystemOps {
  public:
    virtual ~ISystemOps() = default;

    virtual bool IsRoot() const = 0;
    virtual bool CommandExists(std::string_view name) const = 0;

    // Presentational listing, one line per entry.
    virtual Result ListBlockDevices(std::vector<std::string>& out_lines) const = 0;
    virtual bool IsBlockDevice(std::string_view path) const = 0;
    // Source column of the live mount table.
    virtual Result ReadMountSources(std::vector<std::string>& out_sources) const = 0;

    virtual Result ElevateCredentials() const = 0;
    virtual Result Unmount(std::string_view path) const = 0;
    virtual Result WriteImage(const WriteRequest& req) const = 0;
    virtual void SyncAll() const = 0;
    // Resumes a partial file already present at |dest_path|.
    virtual Result Download(std::string_view url, std::string_view dest_path) const = 0;
    virtual Result Eject(std::string_view device) const = 0;
};

class PosixSystemOps final : public ISystemOps {
  public:
    explicit PosixSystemOps(std::string mount_table = "/proc/self/mounts",
                            EnvLookup env = ProcessEnvironment());

    bool IsRoot() const override;
    bool CommandExists(std::string_view name) const override;

    Result ListBlockDevices(std::vector<std::string>& out_lines) const override;
    bool IsBlockDevice(std::string_view path) const override;
    Result ReadMountSources(std::vector<std::string>& out_sources) const override;

    Result ElevateCredentials() const override;
    Result Unmount(std::string_view path) const override;
    Result WriteImage(const WriteRequest& req) const override;
    void SyncAll() const override;
    Result Download(std::string_view url, std::string_view dest_path) const override;
    Result Eject(std::string_view device) const override;

  private:
    // Prefixes "sudo --" unless already running as root.
    std::vector<std::string> Privileged(std::vector<std::string> argv) const;
    Result RunTool(const std::vector<std::string>& argv, const std::string& what) const;
    Result DirectWrite(const WriteRequest& req) const;

    std::string mount_table_;
    EnvLookup env_;
};

} // namespace isoboot
