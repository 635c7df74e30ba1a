#include "util/config_json_utils.hpp"

#include <fstream>
#include <limits>

namespace batchsync::config::detail {

namespace {

// A key is either absent, present with a usable value, or present with the
// wrong type. Only the last one is an error.
enum class Field { Absent, Set, Invalid };

Field GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return Field::Absent;
    if (!it->is_string())
        return Field::Invalid;
    out = it->get<std::string>();
    return Field::Set;
}

Field GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return Field::Absent;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return Field::Set;
    }
    if (!it->is_number_integer())
        return Field::Invalid;
    auto v = it->get<long long>();
    if (v < 0)
        return Field::Invalid;
    out = static_cast<std::uint64_t>(v);
    return Field::Set;
}

Field GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return Field::Absent;
    if (!it->is_boolean())
        return Field::Invalid;
    out = it->get<bool>();
    return Field::Set;
}

bool ReadString(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    if (GetStringIfPresent(j, key, out) == Field::Invalid) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    return true;
}

bool ReadBool(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    if (GetBoolIfPresent(j, key, out) == Field::Invalid) {
        err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    return true;
}

bool ReadU64(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    if (GetU64IfPresent(j, key, out) == Field::Invalid) {
        err = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    return true;
}

bool ReadTimestamp(const nlohmann::json& j,
                   const char* key,
                   bool end_of_day,
                   std::optional<Timestamp>& out,
                   std::string& err) {
    std::string raw;
    const Field f = GetStringIfPresent(j, key, raw);
    if (f == Field::Invalid) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    if (f == Field::Absent || raw.empty())
        return true;

    auto parsed = ParseLocalTimestamp(raw, end_of_day);
    if (!parsed) {
        err = std::string("'") + key + "': " + parsed.error();
        return false;
    }
    out = *parsed;
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, RunConfig& cfg, std::string& err) {
    if (!ReadString(j, "scan_root", cfg.scan_root, err) ||
        !ReadString(j, "remote_source_root", cfg.remote_source_root, err) ||
        !ReadString(j, "remote_dest_root", cfg.remote_dest_root, err) ||
        !ReadString(j, "staging_root", cfg.staging_root, err) ||
        !ReadString(j, "remote_staging_root", cfg.remote_staging_root, err) ||
        !ReadString(j, "outbox_dir", cfg.outbox_dir, err) ||
        !ReadString(j, "source_endpoint", cfg.source_endpoint, err) ||
        !ReadString(j, "dest_endpoint", cfg.dest_endpoint, err) ||
        !ReadString(j, "log_file", cfg.log_file, err)) {
        return false;
    }

    if (!ReadU64(j, "size_threshold_bytes", cfg.size_threshold_bytes, err) ||
        !ReadU64(j, "submit_timeout_seconds", cfg.submit_timeout_seconds, err)) {
        return false;
    }
    {
        std::uint64_t v = cfg.workers;
        if (!ReadU64(j, "workers", v, err))
            return false;
        if (v > std::numeric_limits<unsigned>::max()) {
            err = "'workers' is out of range";
            return false;
        }
        cfg.workers = static_cast<unsigned>(v);
    }

    if (!ReadBool(j, "dry_run", cfg.dry_run, err) ||
        !ReadBool(j, "timestamp_rename", cfg.timestamp_rename, err) ||
        !ReadBool(j, "verify_checksum", cfg.verify_checksum, err) ||
        !ReadBool(j, "preserve_timestamp", cfg.preserve_timestamp, err)) {
        return false;
    }

    if (!ReadTimestamp(j, "window_start", false, cfg.window_start, err) ||
        !ReadTimestamp(j, "window_end", true, cfg.window_end, err)) {
        return false;
    }

    {
        std::string level;
        if (!ReadString(j, "sync_level", level, err))
            return false;
        if (!level.empty()) {
            auto parsed = ParseSyncLevel(level);
            if (!parsed) {
                err = "unknown sync_level '" + level + "'";
                return false;
            }
            cfg.sync_level = *parsed;
        }
    }
    {
        std::string compression;
        if (!ReadString(j, "bundle_compression", compression, err))
            return false;
        if (compression == "gzip") {
            cfg.bundle_compression = BundleCompression::Gzip;
        } else if (compression.empty() || compression == "none") {
            cfg.bundle_compression = BundleCompression::None;
        } else {
            err = "unknown bundle_compression '" + compression + "'";
            return false;
        }
    }
    {
        std::string level;
        if (!ReadString(j, "log_level", level, err))
            return false;
        if (!level.empty()) {
            auto parsed = ParseLogLevel(level);
            if (!parsed) {
                err = "unknown log_level '" + level + "'";
                return false;
            }
            cfg.log_level = *parsed;
        }
    }

    return true;
}

} // namespace batchsync::config::detail
