#include "util/transfer_manifest.hpp"

#include <nlohmann/json.hpp>

namespace batchsync {

using json = nlohmann::ordered_json;

const char* TransferKindName(TransferKind kind) {
    switch (kind) {
        case TransferKind::ArchivedBundle: return "archived-bundle";
        case TransferKind::RawFile:        return "raw-file";
    }
    return "unknown";
}

std::optional<TransferKind> ParseTransferKind(std::string_view s) {
    if (s == "archived-bundle") return TransferKind::ArchivedBundle;
    if (s == "raw-file") return TransferKind::RawFile;
    return std::nullopt;
}

const char* SyncLevelName(SyncLevel level) {
    switch (level) {
        case SyncLevel::None:     return "none";
        case SyncLevel::Exists:   return "exists";
        case SyncLevel::Size:     return "size";
        case SyncLevel::Mtime:    return "mtime";
        case SyncLevel::Checksum: return "checksum";
    }
    return "unknown";
}

std::optional<SyncLevel> ParseSyncLevel(std::string_view s) {
    if (s == "none") return SyncLevel::None;
    if (s == "exists") return SyncLevel::Exists;
    if (s == "size") return SyncLevel::Size;
    if (s == "mtime") return SyncLevel::Mtime;
    if (s == "checksum") return SyncLevel::Checksum;
    return std::nullopt;
}

std::uint64_t TransferManifest::TotalBytes() const {
    std::uint64_t total = 0;
    for (const auto& item : items) total += item.size_bytes;
    return total;
}

std::size_t TransferManifest::CountOf(TransferKind kind) const {
    std::size_t n = 0;
    for (const auto& item : items) {
        if (item.kind == kind) ++n;
    }
    return n;
}

std::string SerializeManifest(const TransferManifest& manifest, int indent) {
    json j;
    j["label"] = manifest.label;
    j["source_endpoint"] = manifest.source_endpoint;
    j["dest_endpoint"] = manifest.dest_endpoint;
    j["sync"] = {
        {"verify_checksum", manifest.policy.verify_checksum},
        {"preserve_timestamp", manifest.policy.preserve_timestamp},
        {"sync_level", SyncLevelName(manifest.policy.sync_level)},
    };

    json items = json::array();
    for (const auto& item : manifest.items) {
        json it;
        it["kind"] = TransferKindName(item.kind);
        it["source"] = item.source;
        it["destination"] = item.destination;
        it["size"] = item.size_bytes;
        if (!item.sha256.empty()) it["sha256"] = item.sha256;
        items.push_back(std::move(it));
    }
    j["items"] = std::move(items);

    return j.dump(indent);
}

} // namespace batchsync
