#include "util/run_config.hpp"

#include "util/config_json_utils.hpp"

namespace batchsync::config {

void RunConfig::Reset() {
    *this = RunConfig{};
}

Result RunConfig::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::Config, -1, err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(ErrorKind::Config, -1, err + " in " + path);
    }

    return Result::Ok();
}

Result RunConfig::Validate() const {
    auto missing = [](const char* key) {
        return Result::Fail(ErrorKind::Config, -1, std::string("missing required '") + key + "'");
    };

    if (scan_root.empty()) return missing("scan_root");
    if (remote_source_root.empty()) return missing("remote_source_root");
    if (remote_dest_root.empty()) return missing("remote_dest_root");
    if (staging_root.empty()) return missing("staging_root");
    if (!dry_run && outbox_dir.empty()) return missing("outbox_dir");

    if (size_threshold_bytes == 0) {
        return Result::Fail(ErrorKind::Config, -1, "'size_threshold_bytes' must be positive");
    }
    if (workers == 0) {
        return Result::Fail(ErrorKind::Config, -1, "'workers' must be at least 1");
    }
    if (window_start.has_value() != window_end.has_value()) {
        return Result::Fail(ErrorKind::Config, -1,
                            "'window_start' and 'window_end' must be given together");
    }
    if (window_start && window_end && *window_end < *window_start) {
        return Result::Fail(ErrorKind::Config, -1, "'window_start' is after 'window_end'");
    }

    return Result::Ok();
}

SyncLevel RunConfig::EffectiveSyncLevel() const {
    if (sync_level) return *sync_level;
    return timestamp_rename ? SyncLevel::None : SyncLevel::Mtime;
}

std::string RunConfig::EffectiveRemoteStagingRoot() const {
    return remote_staging_root.empty() ? staging_root : remote_staging_root;
}

} // namespace batchsync::config
