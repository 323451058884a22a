#pragma once

#include "io/io.hpp"
#include "system/system_ops.hpp"
#include "util/path_utils.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/isoboot_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }
    std::string Join(const std::string& name) const { return path_ + "/" + name; }

  private:
    std::string path_;
};

inline void WriteFile(const std::string& path, const std::string& contents) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good()) throw std::runtime_error("cannot write " + path);
    os << contents;
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

inline isoboot::EnvLookup MapEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

class MemoryReader final : public isoboot::IReader {
  public:
    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

// Stands in for every OS collaborator. Each call is recorded in |calls| so
// tests can assert exactly which irreversible operations happened, in order.
class FakeSystemOps final : public isoboot::ISystemOps {
  public:
    bool root = false;
    std::set<std::string> block_devices{"/dev/sda", "/dev/sdb", "/dev/sdc"};
    std::vector<std::string> mount_sources{"/dev/sda1", "proc", "tmpfs"};
    std::vector<std::string> lsblk_lines{"NAME MAJ:MIN RM SIZE RO TYPE MOUNTPOINTS",
                                         "sda    8:0    0 256G  0 disk",
                                         "sdb    8:16   1  16G  0 disk"};
    std::set<std::string> missing_commands;

    isoboot::Result list_result = isoboot::Result::Ok();
    isoboot::Result mount_table_result = isoboot::Result::Ok();
    isoboot::Result elevate_result = isoboot::Result::Ok();
    isoboot::Result unmount_result = isoboot::Result::Ok();
    isoboot::Result write_result = isoboot::Result::Ok();
    isoboot::Result download_result = isoboot::Result::Ok();
    isoboot::Result eject_result = isoboot::Result::Ok();

    // Written to the destination by a successful Download.
    std::string download_payload = "downloaded image";

    mutable std::vector<std::string> calls;
    mutable std::vector<isoboot::WriteRequest> writes;
    mutable std::vector<std::string> unmounted;
    mutable std::vector<std::pair<std::string, std::string>> downloads;
    mutable std::vector<std::string> ejected;
    mutable int mount_table_reads = 0;

    int Count(std::string_view name) const {
        return static_cast<int>(std::count(calls.begin(), calls.end(), std::string(name)));
    }

    bool IsRoot() const override { return root; }

    bool CommandExists(std::string_view name) const override {
        return missing_commands.count(std::string(name)) == 0;
    }

    isoboot::Result ListBlockDevices(std::vector<std::string>& out_lines) const override {
        calls.emplace_back("lsblk");
        if (!list_result.is_ok()) return list_result;
        out_lines = lsblk_lines;
        return isoboot::Result::Ok();
    }

    bool IsBlockDevice(std::string_view path) const override {
        return block_devices.count(std::string(path)) != 0;
    }

    isoboot::Result ReadMountSources(std::vector<std::string>& out_sources) const override {
        ++mount_table_reads;
        if (!mount_table_result.is_ok()) return mount_table_result;
        out_sources = mount_sources;
        return isoboot::Result::Ok();
    }

    isoboot::Result ElevateCredentials() const override {
        calls.emplace_back("elevate");
        return elevate_result;
    }

    isoboot::Result Unmount(std::string_view path) const override {
        calls.emplace_back("unmount");
        unmounted.emplace_back(path);
        return unmount_result;
    }

    isoboot::Result WriteImage(const isoboot::WriteRequest& req) const override {
        calls.emplace_back("write");
        writes.push_back(req);
        return write_result;
    }

    void SyncAll() const override { calls.emplace_back("sync"); }

    isoboot::Result Download(std::string_view url, std::string_view dest_path) const override {
        calls.emplace_back("download");
        downloads.emplace_back(std::string(url), std::string(dest_path));
        if (!download_result.is_ok()) return download_result;
        WriteFile(std::string(dest_path), download_payload);
        return isoboot::Result::Ok();
    }

    isoboot::Result Eject(std::string_view device) const override {
        calls.emplace_back("eject");
        ejected.emplace_back(device);
        return eject_result;
    }
};

inline isoboot::Result ToolFailure(int code, const std::string& what) {
    return isoboot::Result::Fail(isoboot::ErrorKind::ExternalToolFailure, code,
                                 what + " failed (exit code " + std::to_string(code) + ")");
}

} // namespace testutil
