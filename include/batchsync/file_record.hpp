#pragma once

#include "util/time_window.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace batchsync {

// One regular file captured during a scan. Immutable once built.
struct FileRecord {
    std::filesystem::path path;   // absolute local path
    std::string name;             // base name, also the member name inside a bundle
    std::uint64_t size = 0;
    Timestamp mtime{};
};

// A file (or directory) the scanner could not examine. Never fatal.
struct ScanSkip {
    std::filesystem::path path;
    int err = 0;
    std::string reason;
};

// stat(2), following symlinks, and capture size/mtime. Anything that is not
// a regular file after resolution is reported as a skip.
std::expected<FileRecord, ScanSkip> ExtractFileRecord(const std::filesystem::path& path);

// Qualifying files sharing one immediate parent directory. Never empty.
struct DirectoryGroup {
    std::filesystem::path relative_dir;   // relative to the scan root, empty for the root
    std::vector<FileRecord> files;

    std::size_t FileCount() const { return files.size(); }
    std::uint64_t TotalBytes() const;
    // Integer mean; callers must not ask an empty group.
    std::uint64_t MeanBytes() const;
    std::filesystem::path RelativeFile(const FileRecord& rec) const;
};

} // namespace batchsync
