#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace batchsync {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { Close(); }

Result Fd::Open(const std::string& path, int flags, mode_t mode, Fd& out) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        const int err = errno;
        return Result::Fail(err, "open " + path + ": " + std::strerror(err));
    }
    out.Reset(fd);
    return Result::Ok();
}

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

void Fd::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
}

Result Fd::SyncAndClose() {
    if (fd_ < 0) return Result::Fail(EBADF, "fd not open");

    const int fd = fd_;
    fd_ = -1;
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return Result::Fail(err, std::string("fsync: ") + std::strerror(err));
    }
    if (::close(fd) != 0) {
        const int err = errno;
        return Result::Fail(err, std::string("close: ") + std::strerror(err));
    }
    return Result::Ok();
}

} // namespace batchsync
