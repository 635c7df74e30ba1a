#pragma once

#include "batchsync/file_record.hpp"
#include "util/result.hpp"
#include "util/time_window.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace batchsync {

// Walks a tree depth-first, entries in lexicographic order, and reports every
// regular file whose mtime lies inside the window, one group per parent
// directory. Successes and skips travel on separate channels.
//
// Symlinks to files are followed; symlinks to directories are never entered.
// Directories are also remembered by (device, inode) so a bind mount that
// loops back into the tree is visited only once.
class ChangeScanner {
  public:
    struct Options {
        const std::atomic_bool* cancel = nullptr;
    };

    struct Stats {
        std::uint64_t directories_visited = 0;
        std::uint64_t files_considered = 0;   // candidate files, in or out of the window
        std::uint64_t files_in_window = 0;
        std::uint64_t files_skipped = 0;
        std::uint64_t groups = 0;
    };

    using GroupSink = std::function<void(DirectoryGroup&&)>;
    using SkipSink = std::function<void(const ScanSkip&)>;

    ChangeScanner() = default;
    explicit ChangeScanner(const Options& opt) : opt_(opt) {}

    // Each group is delivered as soon as its directory has been read.
    // Fails with ErrorKind::Config when root is not a directory and with
    // ErrorKind::Cancelled when the cancel flag is raised mid-walk.
    Result Walk(const std::filesystem::path& root,
                const TimeWindow& window,
                const GroupSink& on_group,
                const SkipSink& on_skip,
                Stats* stats = nullptr) const;

  private:
    bool Cancelled() const { return opt_.cancel && opt_.cancel->load(std::memory_order_relaxed); }

    Options opt_{};
};

struct ScanResult {
    std::vector<DirectoryGroup> groups;
    std::vector<ScanSkip> skipped;
    ChangeScanner::Stats stats;
};

// Walk() collected into memory.
Result ScanTree(const ChangeScanner& scanner,
                const std::filesystem::path& root,
                const TimeWindow& window,
                ScanResult& out);

} // namespace batchsync
