#include "io/fd.hpp"

#include <cerrno>
#include <unistd.h>

namespace luasync {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        (void)Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

int Fd::Close() {
    if (fd_ < 0) return 0;
    const int fd = fd_;
    fd_ = -1;
    // close(2) must not be retried on EINTR on Linux.
    return ::close(fd);
}

} // namespace luasync
