#include "batchsync/manifest_builder.hpp"

#include "util/path_utils.hpp"

#include <utility>

namespace batchsync {

std::string TimestampedFileName(std::string_view filename, Timestamp mtime) {
    auto [stem, ext] = SplitExtension(filename);
    return stem + "_" + FormatLocal(mtime, "%Y%m%d_%H%M%S") + ext;
}

ManifestBuilder::ManifestBuilder(const Options& opt, std::string label, SyncPolicy policy) {
    opt_.remote_source_root = NormalizeRemotePath(opt.remote_source_root);
    opt_.remote_dest_root = NormalizeRemotePath(opt.remote_dest_root);
    opt_.remote_staging_root = NormalizeRemotePath(opt.remote_staging_root);
    opt_.timestamp_rename = opt.timestamp_rename;

    manifest_.label = std::move(label);
    manifest_.policy = policy;
}

void ManifestBuilder::SetEndpoints(std::string source_endpoint, std::string dest_endpoint) {
    manifest_.source_endpoint = std::move(source_endpoint);
    manifest_.dest_endpoint = std::move(dest_endpoint);
}

TransferItem ManifestBuilder::ArchiveItem(const ArchiveBundle& bundle) const {
    std::string rel = RemoteRelative(bundle.relative_dir);
    if (rel.empty()) rel = std::string(kRootBundleBase);

    TransferItem item;
    item.kind = TransferKind::ArchivedBundle;
    item.source = RemoteJoin(opt_.remote_staging_root, manifest_.label, bundle.name);
    item.destination = RemoteJoin(opt_.remote_dest_root, rel + bundle.extension);
    item.size_bytes = bundle.size_bytes;
    item.sha256 = bundle.sha256;
    return item;
}

TransferItem ManifestBuilder::RawItem(const DirectoryGroup& group, const FileRecord& rec) const {
    const std::string rel_dir = RemoteRelative(group.relative_dir);
    const std::string dest_name =
        opt_.timestamp_rename ? TimestampedFileName(rec.name, rec.mtime) : rec.name;

    TransferItem item;
    item.kind = TransferKind::RawFile;
    item.source = RemoteJoin(opt_.remote_source_root, rel_dir, rec.name);
    item.destination = RemoteJoin(opt_.remote_dest_root, rel_dir, dest_name);
    item.size_bytes = rec.size;
    return item;
}

void ManifestBuilder::AddArchive(const ArchiveBundle& bundle) {
    manifest_.items.push_back(ArchiveItem(bundle));
}

std::size_t ManifestBuilder::AddRaw(const DirectoryGroup& group) {
    for (const auto& rec : group.files) {
        manifest_.items.push_back(RawItem(group, rec));
    }
    return group.files.size();
}

TransferManifest ManifestBuilder::Finish() {
    TransferManifest out = std::move(manifest_);
    manifest_ = TransferManifest{};
    manifest_.label = out.label;
    manifest_.policy = out.policy;
    return out;
}

} // namespace batchsync
