#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace batchsync {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    auto r = Fd::Open(out.path_, O_RDONLY, 0, out.fd_);
    if (!r.is_ok()) {
        return r;
    }

    if (::fstat(out.fd_.Get(), &out.st_) != 0) {
        const int err = errno;
        out.fd_.Close();
        return Result::Fail(err, "fstat " + out.path_ + ": " + std::strerror(err));
    }
    if (!S_ISREG(out.st_.st_mode)) {
        out.fd_.Close();
        return Result::Fail(EINVAL, "not a regular file: " + out.path_);
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const {
    if (!fd_.Valid()) return std::nullopt;
    return static_cast<std::uint64_t>(st_.st_size);
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
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

} // namespace batchsync
