#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace batchsync {

enum class TransferKind {
    ArchivedBundle,
    RawFile,
};

// How the transfer service decides whether a destination is already current.
enum class SyncLevel {
    None,
    Exists,
    Size,
    Mtime,
    Checksum,
};

const char* TransferKindName(TransferKind kind);
std::optional<TransferKind> ParseTransferKind(std::string_view s);

const char* SyncLevelName(SyncLevel level);
std::optional<SyncLevel> ParseSyncLevel(std::string_view s);

struct SyncPolicy {
    bool verify_checksum = true;
    bool preserve_timestamp = true;
    SyncLevel sync_level = SyncLevel::None;
};

// Source and destination are remote (POSIX) locators.
struct TransferItem {
    std::string source;
    std::string destination;
    TransferKind kind = TransferKind::RawFile;
    std::uint64_t size_bytes = 0;
    std::string sha256;   // bundles only, when checksums are enabled
};

struct TransferManifest {
    std::string label;
    SyncPolicy policy;
    std::string source_endpoint;
    std::string dest_endpoint;
    std::vector<TransferItem> items;

    bool empty() const { return items.empty(); }
    std::uint64_t TotalBytes() const;
    std::size_t CountOf(TransferKind kind) const;
};

// JSON document handed to the transfer agent. Field order is stable.
std::string SerializeManifest(const TransferManifest& manifest, int indent = 2);

} // namespace batchsync
