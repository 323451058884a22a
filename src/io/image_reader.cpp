#include "io/image_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace isoboot {

Result ImageReader::Open(std::string path, ImageReader& out) {
    out.path_ = std::move(path);
    out.size_.reset();

    Fd fd(::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        return Result::Io(
            errno, "Failed to open image: " + out.path_ + " (" + std::strerror(errno) + ")");
    }

    struct stat st{};
    if (::fstat(fd.Get(), &st) != 0) {
        return Result::Io(errno, "fstat failed on " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Io(EINVAL, "Image is not a regular file: " + out.path_);
    }

    out.size_ = static_cast<std::uint64_t>(st.st_size);
    out.fd_ = std::move(fd);
    return Result::Ok();
}

ssize_t ImageReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace isoboot
