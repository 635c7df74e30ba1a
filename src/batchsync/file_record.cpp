#include "batchsync/file_record.hpp"

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace batchsync {

std::expected<FileRecord, ScanSkip> ExtractFileRecord(const std::filesystem::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        const int err = errno;
        std::string reason = std::strerror(err);
        if (err == ENOENT) {
            reason += " (vanished or dangling symlink)";
        }
        return std::unexpected(ScanSkip{.path = path, .err = err, .reason = std::move(reason)});
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(ScanSkip{.path = path, .err = EINVAL, .reason = "not a regular file"});
    }

    FileRecord rec;
    rec.path = path;
    rec.name = path.filename().string();
    rec.size = static_cast<std::uint64_t>(st.st_size);
    rec.mtime = FromTimespec(st.st_mtim);
    return rec;
}

std::uint64_t DirectoryGroup::TotalBytes() const {
    std::uint64_t total = 0;
    for (const auto& f : files) total += f.size;
    return total;
}

std::uint64_t DirectoryGroup::MeanBytes() const {
    return files.empty() ? 0 : TotalBytes() / files.size();
}

std::filesystem::path DirectoryGroup::RelativeFile(const FileRecord& rec) const {
    return relative_dir.empty() ? std::filesystem::path(rec.name) : relative_dir / rec.name;
}

} // namespace batchsync
