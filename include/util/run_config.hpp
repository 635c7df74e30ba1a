#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"
#include "util/time_window.hpp"
#include "util/transfer_manifest.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace batchsync::config {

inline constexpr std::uint64_t kDefaultSizeThresholdBytes = 50ULL * 1024 * 1024;
inline constexpr unsigned kDefaultWorkers = 4;
inline constexpr std::uint64_t kDefaultSubmitTimeoutSeconds = 300;

enum class BundleCompression {
    None,
    Gzip,
};

class RunConfig {
public:
    std::string scan_root;
    std::string remote_source_root;
    std::string remote_dest_root;
    std::string staging_root;
    std::string remote_staging_root;
    std::string outbox_dir;
    std::string source_endpoint;
    std::string dest_endpoint;
    std::string log_file;

    std::uint64_t size_threshold_bytes = kDefaultSizeThresholdBytes;
    std::optional<Timestamp> window_start;
    std::optional<Timestamp> window_end;

    bool dry_run = false;
    bool timestamp_rename = true;
    bool verify_checksum = true;
    bool preserve_timestamp = true;
    std::optional<SyncLevel> sync_level;
    BundleCompression bundle_compression = BundleCompression::None;

    unsigned workers = kDefaultWorkers;
    std::uint64_t submit_timeout_seconds = kDefaultSubmitTimeoutSeconds;
    LogLevel log_level = LogLevel::Info;

    // Reads a JSON object file on top of the defaults. Missing optional keys
    // keep their defaults; wrong types and unknown enum values fail.
    Result LoadFile(const std::string& path);

    // Cross-field checks; run after LoadFile() and any command-line overrides.
    Result Validate() const;

    // Mirroring destinations can rely on mtime comparison; timestamped
    // destinations are always new, so no sync check is needed.
    SyncLevel EffectiveSyncLevel() const;

    // Falls back to staging_root, as the staging area is usually reachable
    // under the same path from the transfer service.
    std::string EffectiveRemoteStagingRoot() const;

    void Reset();
};

} // namespace batchsync::config
