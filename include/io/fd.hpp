#pragma once

#include "util/result.hpp"

#include <string>
#include <sys/types.h>

namespace batchsync {

class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // open(2) with O_CLOEXEC added; errno is kept in Result::err.
    static Result Open(const std::string& path, int flags, mode_t mode, Fd& out);

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    void Close();

    // fsync(2) then close(2), reporting either failure. Used for files whose
    // contents must be durable before they are renamed into place.
    Result SyncAndClose();

  private:
    int fd_{-1};
};

} // namespace batchsync
