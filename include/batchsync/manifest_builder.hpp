#pragma once

#include "batchsync/archive_builder.hpp"
#include "batchsync/file_record.hpp"
#include "util/time_window.hpp"
#include "util/transfer_manifest.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace batchsync {

// "name.ext" -> "name_YYYYMMDD_HHMMSS.ext", mtime in local time.
std::string TimestampedFileName(std::string_view filename, Timestamp mtime);

// Turns staged bundles and raw groups into transfer items. All locators it
// produces are remote POSIX paths joined with '/'.
//
//   bundle: <remote_staging_root>/<label>/<bundle name>
//        -> <remote_dest_root>/<relative dir><ext>
//   raw:    <remote_source_root>/<relative dir>/<name>
//        -> <remote_dest_root>/<relative dir>/<name or timestamped name>
class ManifestBuilder {
  public:
    struct Options {
        std::string remote_source_root;
        std::string remote_dest_root;
        std::string remote_staging_root;
        // Off: destinations mirror sources, so a later run over an overlapping
        // window overwrites (and mtime sync can skip unchanged files).
        bool timestamp_rename = true;
    };

    ManifestBuilder(const Options& opt, std::string label, SyncPolicy policy);

    void SetEndpoints(std::string source_endpoint, std::string dest_endpoint);

    TransferItem ArchiveItem(const ArchiveBundle& bundle) const;
    TransferItem RawItem(const DirectoryGroup& group, const FileRecord& rec) const;

    void AddArchive(const ArchiveBundle& bundle);
    // One item per file; returns how many were added.
    std::size_t AddRaw(const DirectoryGroup& group);

    const TransferManifest& Current() const { return manifest_; }
    TransferManifest Finish();

  private:
    Options opt_;
    TransferManifest manifest_;
};

} // namespace batchsync
