#include "batchsync/change_scanner.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <set>
#include <string>
#include <sys/stat.h>
#include <utility>

namespace fs = std::filesystem;

namespace batchsync {

namespace {

using DirKey = std::pair<dev_t, ino_t>;

fs::path JoinRelative(const fs::path& rel_dir, const fs::path& name) {
    return rel_dir.empty() ? name : rel_dir / name;
}

} // namespace

Result ChangeScanner::Walk(const fs::path& root,
                           const TimeWindow& window,
                           const GroupSink& on_group,
                           const SkipSink& on_skip,
                           Stats* stats) const {
    Stats local{};
    Stats& st = stats ? *stats : local;
    st = Stats{};

    std::error_code ec;
    const fs::path abs_root = fs::absolute(root, ec).lexically_normal();
    if (ec) {
        return Result::Fail(ErrorKind::Config, ec.value(),
                            "cannot resolve scan root " + root.string() + ": " + ec.message());
    }
    if (!fs::is_directory(abs_root, ec)) {
        return Result::Fail(ErrorKind::Config, ec ? ec.value() : ENOTDIR,
                            "scan root is not a directory: " + abs_root.string());
    }

    auto skip = [&](ScanSkip s) {
        ++st.files_skipped;
        LogWarn("skip: %s (%s)", s.path.c_str(), s.reason.c_str());
        if (on_skip) on_skip(s);
    };

    std::set<DirKey> visited;
    std::vector<fs::path> pending{fs::path()};

    while (!pending.empty()) {
        if (Cancelled()) return Result::Fail(ErrorKind::Cancelled, ECANCELED, "scan cancelled");

        const fs::path rel_dir = std::move(pending.back());
        pending.pop_back();
        const fs::path abs_dir = rel_dir.empty() ? abs_root : abs_root / rel_dir;

        struct stat dst{};
        if (::stat(abs_dir.c_str(), &dst) == 0 &&
            !visited.insert(DirKey{dst.st_dev, dst.st_ino}).second) {
            LogWarn("directory already visited, not descending again: %s", abs_dir.c_str());
            continue;
        }

        std::vector<fs::path> names;
        fs::directory_iterator it(abs_dir, ec);
        if (ec) {
            skip(ScanSkip{.path = abs_dir, .err = ec.value(),
                          .reason = "cannot list directory: " + ec.message()});
            continue;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            names.push_back(it->path().filename());
        }
        if (ec) {
            skip(ScanSkip{.path = abs_dir, .err = ec.value(),
                          .reason = "directory listing interrupted: " + ec.message()});
        }
        ++st.directories_visited;

        std::sort(names.begin(), names.end(),
                  [](const fs::path& a, const fs::path& b) { return a.native() < b.native(); });

        DirectoryGroup group;
        group.relative_dir = rel_dir;
        std::vector<fs::path> subdirs;

        for (const auto& name : names) {
            if (Cancelled()) return Result::Fail(ErrorKind::Cancelled, ECANCELED, "scan cancelled");

            const fs::path entry = abs_dir / name;
            const fs::file_status lst = fs::symlink_status(entry, ec);
            if (ec) {
                ++st.files_considered;
                skip(ScanSkip{.path = entry, .err = ec.value(), .reason = ec.message()});
                continue;
            }

            if (fs::is_directory(lst)) {
                subdirs.push_back(JoinRelative(rel_dir, name));
                continue;
            }
            if (fs::is_symlink(lst)) {
                const fs::file_status target = fs::status(entry, ec);
                if (!ec && fs::is_directory(target)) {
                    LogDebug("not following directory symlink: %s", entry.c_str());
                    continue;
                }
                // Dangling links fall through and are reported by the extractor.
            } else if (!fs::is_regular_file(lst)) {
                LogDebug("ignoring special file: %s", entry.c_str());
                continue;
            }

            ++st.files_considered;
            auto rec = ExtractFileRecord(entry);
            if (!rec) {
                skip(std::move(rec.error()));
                continue;
            }
            if (!window.Contains(rec->mtime)) continue;

            ++st.files_in_window;
            group.files.push_back(std::move(*rec));
        }

        if (!group.files.empty()) {
            ++st.groups;
            LogDebug("group: %s (%zu files)",
                     rel_dir.empty() ? "." : rel_dir.c_str(), group.files.size());
            if (on_group) on_group(std::move(group));
        }

        // Reverse so the lexicographically first child is popped next.
        for (auto sit = subdirs.rbegin(); sit != subdirs.rend(); ++sit) {
            pending.push_back(std::move(*sit));
        }
    }

    return Result::Ok();
}

Result ScanTree(const ChangeScanner& scanner,
                const fs::path& root,
                const TimeWindow& window,
                ScanResult& out) {
    out = ScanResult{};
    return scanner.Walk(
        root,
        window,
        [&out](DirectoryGroup&& g) { out.groups.push_back(std::move(g)); },
        [&out](const ScanSkip& s) { out.skipped.push_back(s); },
        &out.stats);
}

} // namespace batchsync
