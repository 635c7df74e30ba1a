#pragma once

#include "batchsync/group_classifier.hpp"
#include "util/result.hpp"
#include "util/run_config.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

namespace batchsync {

struct ArchiveBundle {
    std::filesystem::path local_path;     // <staging_root>/<window label>/<name>
    std::string name;                     // "<dir_with_underscores>.tar[.gz]"
    std::string extension;                // ".tar" or ".tar.gz"
    std::filesystem::path relative_dir;   // group directory the bundle stands for
    std::size_t member_count = 0;
    std::uint64_t size_bytes = 0;
    std::string sha256;
    bool staged = false;                  // false for a dry-run plan
};

// Writes one tar bundle per ARCHIVE group into the staging area.
//
// Members are stored under their base name only. Groups are per directory
// and a directory cannot hold two entries with the same name, so members of
// one bundle never collide.
//
// Bundle names depend only on (window label, relative directory), so
// building the same group twice yields the same path and two runs over
// different windows never share a bundle.
//
// Build() is safe to call concurrently for different groups; a single bundle
// is always written by one thread from start to finish.
class ArchiveBuilder {
  public:
    struct Options {
        std::filesystem::path staging_root;
        std::string window_label;
        config::BundleCompression compression = config::BundleCompression::None;
        bool compute_checksum = true;
    };

    explicit ArchiveBuilder(Options opt) : opt_(std::move(opt)) {}

    static const char* Extension(config::BundleCompression compression);

    std::string BundleName(const std::filesystem::path& relative_dir) const;
    std::filesystem::path BundleDir() const;

    // Where Build() would put the bundle, without touching the disk.
    ArchiveBundle Plan(const ClassifiedGroup& group) const;

    Result PrepareStagingDir() const;

    // The bundle only appears under its final name once it is complete and
    // synced; on failure nothing is left behind.
    Result Build(const ClassifiedGroup& group, ArchiveBundle& out) const;

    // Remove a staged bundle that will not be submitted.
    Result Discard(const ArchiveBundle& bundle) const;

  private:
    Options opt_;
};

} // namespace batchsync
