#include "io/fd.hpp"

#include <cerrno>
#include <unistd.h>

namespace isoboot {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

int Fd::Close() {
    if (fd_ < 0) return 0;
    const int fd = Release();
    // EINTR on Linux still releases the descriptor; never retry.
    const int rc = ::close(fd);
    if (rc != 0 && errno == EINTR) return 0;
    return rc;
}

} // namespace isoboot
