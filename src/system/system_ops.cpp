#include "system/system_ops.hpp"

#include "io/console_progress.hpp"
#include "io/device_writer.hpp"
#include "io/image_copier.hpp"
#include "io/image_reader.hpp"
#include "system/process.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <mntent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace isoboot {

PosixSystemOps::PosixSystemOps(std::string mount_table, EnvLookup env)
    : mount_table_(std::move(mount_table)), env_(env ? std::move(env) : ProcessEnvironment()) {}

bool PosixSystemOps::IsRoot() const { return ::geteuid() == 0; }

bool PosixSystemOps::CommandExists(std::string_view name) const {
    return FindExecutable(name, env_).has_value();
}

Result PosixSystemOps::ListBlockDevices(std::vector<std::string>& out_lines) const {
    int code = 0;
    auto res = RunProcessCapture({"lsblk"}, out_lines, code);
    if (!res.is_ok()) return res;
    if (code != 0) {
        return Result::Fail(ErrorKind::ExternalToolFailure, code,
                            "lsblk failed (exit code " + std::to_string(code) + ")");
    }
    return Result::Ok();
}

bool PosixSystemOps::IsBlockDevice(std::string_view path) const {
    struct stat st{};
    if (::stat(std::string(path).c_str(), &st) != 0) return false;
    return S_ISBLK(st.st_mode);
}

Result PosixSystemOps::ReadMountSources(std::vector<std::string>& out_sources) const {
    out_sources.clear();

    FILE* table = ::setmntent(mount_table_.c_str(), "r");
    if (!table) {
        return Result::Io(errno,
                          "cannot read mount table " + mount_table_ + " (" + std::strerror(errno) + ")");
    }

    struct mntent entry{};
    char buf[4096];
    while (::getmntent_r(table, &entry, buf, sizeof(buf)) != nullptr) {
        if (entry.mnt_fsname && *entry.mnt_fsname) {
            out_sources.emplace_back(entry.mnt_fsname);
        }
    }
    ::endmntent(table);
    return Result::Ok();
}

Result PosixSystemOps::ElevateCredentials() const {
    if (IsRoot()) return Result::Ok();

    auto res = RunTool({"sudo", "-v"}, "sudo");
    if (!res.is_ok()) {
        return Result::Fail(ErrorKind::PrivilegeDenied, res.err, res.msg);
    }
    return Result::Ok();
}

Result PosixSystemOps::Unmount(std::string_view path) const {
    return RunTool(Privileged({"umount", "--", std::string(path)}), "umount");
}

Result PosixSystemOps::WriteImage(const WriteRequest& req) const {
    if (req.backend == WriteBackend::Direct) {
        return DirectWrite(req);
    }

    return RunTool(Privileged({"dd",
                               "bs=" + std::to_string(req.block_size_bytes),
                               "if=" + req.image_path,
                               "of=" + req.device_path,
                               "status=progress",
                               "conv=fdatasync"}),
                   "dd");
}

void PosixSystemOps::SyncAll() const { ::sync(); }

Result PosixSystemOps::Download(std::string_view url, std::string_view dest_path) const {
    return RunTool({"wget", "--show-progress", "-c", std::string(url), "-O", std::string(dest_path)},
                   "wget");
}

Result PosixSystemOps::Eject(std::string_view device) const {
    return RunTool(Privileged({"eject", std::string(device)}), "eject");
}

std::vector<std::string> PosixSystemOps::Privileged(std::vector<std::string> argv) const {
    if (IsRoot()) return argv;
    std::vector<std::string> out{"sudo", "--"};
    out.insert(out.end(), argv.begin(), argv.end());
    return out;
}

Result PosixSystemOps::RunTool(const std::vector<std::string>& argv, const std::string& what) const {
    int code = 0;
    auto res = RunProcess(argv, code);
    if (!res.is_ok()) return res;

    if (code == kExecFailedExit) {
        return Result::Fail(ErrorKind::ExternalToolFailure, code, what + " could not be executed");
    }
    if (code != 0) {
        return Result::Fail(ErrorKind::ExternalToolFailure, code,
                            what + " failed (exit code " + std::to_string(code) + ")");
    }
    return Result::Ok();
}

Result PosixSystemOps::DirectWrite(const WriteRequest& req) const {
    if (!IsRoot()) {
        return Result::Fail(ErrorKind::PrivilegeDenied, EPERM, "direct write requires root");
    }

    ImageReader reader;
    auto rr = ImageReader::Open(req.image_path, reader);
    if (!rr.is_ok()) return rr;

    DeviceWriter writer;
    auto wr = DeviceWriter::Open(req.device_path, writer);
    if (!wr.is_ok()) return wr;

    ScopedSignalCancel cancel_scope;
    ConsoleProgressSink sink;

    CopyOptions opt;
    opt.block_size_bytes = req.block_size_bytes;
    opt.fsync_interval_bytes = req.fsync_interval_bytes;
    opt.progress = &sink;
    opt.label = req.device_path;

    auto cr = ImageCopier{}.Run(reader, writer, opt);
    if (!cr.is_ok()) return cr;

    return writer.Close();
}

} // namespace isoboot
