#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace luasync {

namespace {

Result Errno(const std::string& what, const std::string& path) {
    const int err = errno;
    return Result::Fail(ErrorKind::FileSystemError,
                        what + ": " + path + " (" + std::strerror(err) + ")");
}

} // namespace

Result FileWriter::Open(std::string path, FileWriter& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Errno("Failed to open output", out.path_);
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (!fd_.Valid()) {
        return Result::Fail(ErrorKind::FileSystemError, "Write on closed file: " + path_);
    }

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
        return Errno("Write failed", path_);
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Errno("fsync failed", path_);
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    if (fd_.Close() != 0) {
        return Errno("close failed", path_);
    }
    return Result::Ok();
}

} // namespace luasync
