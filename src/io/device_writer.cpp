// device_writer.cpp - Raw writer for the target block device.

#include "io/device_writer.hpp"

#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace isoboot {

Result DeviceWriter::Open(std::string path, DeviceWriter& out) {
    out.path_ = std::move(path);

    int flags = O_WRONLY | O_CLOEXEC;
    if (IsDevPath(out.path_)) {
        // O_EXCL on a block device fails with EBUSY while the kernel has it
        // in use (mounted filesystem, swap, device-mapper holder).
        flags |= O_EXCL;
    } else {
        flags |= O_CREAT | O_TRUNC;
    }
    int fd = ::open(out.path_.c_str(), flags, 0644);
    if (fd < 0) {
        return Result::Io(
            errno, "Failed to open output: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result DeviceWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        if (n == 0) {
            return Result::Io(ENOSPC, "Write to " + path_ + " made no progress (device full?)");
        }
        return Result::Io(errno, "Write to " + path_ + " failed (" + std::strerror(errno) + ")");
    }

    return Result::Ok();
}

Result DeviceWriter::Flush() {
    if (::fdatasync(fd_.Get()) == -1) {
        return Result::Io(errno, "fdatasync failed on " + path_ + " (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

Result DeviceWriter::Close() {
    if (fd_.Close() != 0) {
        return Result::Io(errno, "close failed on " + path_ + " (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

} // namespace isoboot
