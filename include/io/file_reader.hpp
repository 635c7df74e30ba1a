#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <sys/stat.h>

namespace batchsync {

// Sequential reader over a regular file. The stat captured at open time
// describes exactly the bytes the reader will deliver (up to TotalSize()).
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }
    const struct stat& Stat() const { return st_; }

private:
    std::string path_;
    Fd fd_;
    struct stat st_{};
};

} // namespace batchsync
