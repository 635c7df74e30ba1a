#include "batchsync/archive_builder.hpp"

#include "crypto/sha256.hpp"
#include "io/fd.hpp"
#include "io/file_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <span>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace batchsync {

namespace {

constexpr size_t kCopyChunk = 64 * 1024;

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = a ? archive_error_string(a) : nullptr;
    return s ? s : "unknown libarchive error";
}

// Unlinks a half-written temp file unless the bundle was committed.
class PartialFile {
  public:
    explicit PartialFile(std::string path) : path_(std::move(path)) {}
    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;
    ~PartialFile() {
        if (!path_.empty()) ::unlink(path_.c_str());
    }

    const std::string& Path() const { return path_; }
    void Commit() { path_.clear(); }

  private:
    std::string path_;
};

Result AppendMember(archive* aw, const FileRecord& rec) {
    FileReader reader;
    auto open_res = FileReader::Open(rec.path.string(), reader);
    if (!open_res.is_ok()) return open_res;

    const struct stat& st = reader.Stat();
    std::unique_ptr<archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
    if (!entry) return Result::Fail(ENOMEM, "archive_entry_new failed");

    archive_entry_copy_stat(entry.get(), &st);
    archive_entry_set_pathname(entry.get(), rec.name.c_str());

    if (archive_write_header(aw, entry.get()) != ARCHIVE_OK) {
        return Result::Fail(archive_errno(aw), "archive_write_header " + rec.name + ": " + ArchiveErr(aw));
    }

    std::uint64_t remaining = static_cast<std::uint64_t>(st.st_size);
    std::vector<std::uint8_t> buf(kCopyChunk);
    while (remaining > 0) {
        const size_t want = static_cast<size_t>(std::min<std::uint64_t>(buf.size(), remaining));
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), want));
        if (n < 0) return Result::Fail(errno, "read " + rec.path.string() + ": " + std::strerror(errno));
        if (n == 0) break;

        const la_ssize_t w = archive_write_data(aw, buf.data(), static_cast<size_t>(n));
        if (w < 0) {
            return Result::Fail(archive_errno(aw), "archive_write_data " + rec.name + ": " + ArchiveErr(aw));
        }
        remaining -= static_cast<std::uint64_t>(n);
    }
    if (remaining > 0) {
        return Result::Fail(EIO, "file shrank while archiving: " + rec.path.string());
    }

    if (archive_write_finish_entry(aw) != ARCHIVE_OK) {
        return Result::Fail(archive_errno(aw), "archive_write_finish_entry " + rec.name + ": " + ArchiveErr(aw));
    }
    return Result::Ok();
}

} // namespace

const char* ArchiveBuilder::Extension(config::BundleCompression compression) {
    return compression == config::BundleCompression::Gzip ? ".tar.gz" : ".tar";
}

std::string ArchiveBuilder::BundleName(const fs::path& relative_dir) const {
    return BundleBaseName(relative_dir) + Extension(opt_.compression);
}

fs::path ArchiveBuilder::BundleDir() const {
    return opt_.staging_root / opt_.window_label;
}

ArchiveBundle ArchiveBuilder::Plan(const ClassifiedGroup& group) const {
    ArchiveBundle b;
    b.extension = Extension(opt_.compression);
    b.name = BundleBaseName(group.group.relative_dir) + b.extension;
    b.local_path = BundleDir() / b.name;
    b.relative_dir = group.group.relative_dir;
    b.member_count = group.group.files.size();
    b.size_bytes = group.total_bytes;
    return b;
}

Result ArchiveBuilder::PrepareStagingDir() const {
    std::error_code ec;
    const fs::path dir = BundleDir();
    fs::create_directories(dir, ec);
    if (ec) {
        return Result::Fail(ErrorKind::Staging, ec.value(),
                            "cannot create staging dir " + dir.string() + ": " + ec.message());
    }
    return Result::Ok();
}

Result ArchiveBuilder::Build(const ClassifiedGroup& group, ArchiveBundle& out) const {
    const std::string dir_label =
        group.group.relative_dir.empty() ? "." : group.group.relative_dir.string();
    auto fail = [&dir_label](const Result& r) {
        return r.As(ErrorKind::Staging, "staging " + dir_label);
    };

    if (group.strategy != Strategy::Archive) {
        return Result::Fail(ErrorKind::Staging, EINVAL, "group is not ARCHIVE: " + dir_label);
    }
    if (group.group.files.empty()) {
        return Result::Fail(ErrorKind::Staging, EINVAL, "empty group: " + dir_label);
    }

    ArchiveBundle bundle = Plan(group);

    if (auto r = PrepareStagingDir(); !r.is_ok()) return r;

    std::string tmpl = bundle.local_path.string() + ".partial-XXXXXX";
    std::vector<char> name_buf(tmpl.begin(), tmpl.end());
    name_buf.push_back('\0');
    const int raw_fd = ::mkstemp(name_buf.data());
    if (raw_fd < 0) {
        const int err = errno;
        return fail(Result::Fail(err, "mkstemp " + tmpl + ": " + std::strerror(err)));
    }
    Fd out_fd(raw_fd);
    PartialFile partial(name_buf.data());

    {
        std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_new());
        if (!aw) return fail(Result::Fail(ENOMEM, "archive_write_new failed"));

        if (archive_write_set_format_pax_restricted(aw.get()) != ARCHIVE_OK) {
            return fail(Result::Fail(-1, "archive_write_set_format_pax_restricted: " + ArchiveErr(aw.get())));
        }
        if (opt_.compression == config::BundleCompression::Gzip &&
            archive_write_add_filter_gzip(aw.get()) != ARCHIVE_OK) {
            return fail(Result::Fail(-1, "archive_write_add_filter_gzip: " + ArchiveErr(aw.get())));
        }
        if (archive_write_open_fd(aw.get(), out_fd.Get()) != ARCHIVE_OK) {
            return fail(Result::Fail(-1, "archive_write_open_fd: " + ArchiveErr(aw.get())));
        }

        for (const auto& rec : group.group.files) {
            LogDebug("[%s] add %s", bundle.name.c_str(), rec.name.c_str());
            auto r = AppendMember(aw.get(), rec);
            if (!r.is_ok()) return fail(r);
        }

        if (archive_write_close(aw.get()) != ARCHIVE_OK) {
            return fail(Result::Fail(archive_errno(aw.get()), "archive_write_close: " + ArchiveErr(aw.get())));
        }
    }

    if (::fchmod(out_fd.Get(), 0644) != 0) {
        const int err = errno;
        return fail(Result::Fail(err, std::string("fchmod: ") + std::strerror(err)));
    }
    if (auto r = out_fd.SyncAndClose(); !r.is_ok()) return fail(r);

    if (::rename(partial.Path().c_str(), bundle.local_path.c_str()) != 0) {
        const int err = errno;
        return fail(Result::Fail(err, "rename to " + bundle.local_path.string() + ": " + std::strerror(err)));
    }
    partial.Commit();

    struct stat st{};
    if (::stat(bundle.local_path.c_str(), &st) == 0) {
        bundle.size_bytes = static_cast<std::uint64_t>(st.st_size);
    }

    if (opt_.compute_checksum) {
        auto r = Sha256HexFile(bundle.local_path.string(), bundle.sha256);
        if (!r.is_ok()) {
            std::error_code ec;
            fs::remove(bundle.local_path, ec);
            return fail(r);
        }
    }

    bundle.staged = true;
    LogInfo("Staged %s (%zu files, %llu bytes)",
            bundle.local_path.c_str(), bundle.member_count, (unsigned long long)bundle.size_bytes);
    out = std::move(bundle);
    return Result::Ok();
}

Result ArchiveBuilder::Discard(const ArchiveBundle& bundle) const {
    if (!bundle.staged) return Result::Ok();

    std::error_code ec;
    fs::remove(bundle.local_path, ec);
    if (ec) {
        return Result::Fail(ErrorKind::Staging, ec.value(),
                            "cannot remove " + bundle.local_path.string() + ": " + ec.message());
    }
    LogInfo("Discarded staged bundle %s", bundle.local_path.c_str());
    return Result::Ok();
}

} // namespace batchsync
