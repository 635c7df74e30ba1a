#include "batchsync/transfer_run.hpp"

#include "batchsync/change_scanner.hpp"
#include "batchsync/group_classifier.hpp"
#include "util/logger.hpp"
#include "util/worker_pool.hpp"

#include <algorithm>
#include <cerrno>
#include <future>
#include <map>

namespace fs = std::filesystem;

namespace batchsync {

namespace {

const char* DirLabel(const fs::path& rel) {
    return rel.empty() ? "." : rel.c_str();
}

unsigned long long ULL(std::uint64_t v) {
    return static_cast<unsigned long long>(v);
}

} // namespace

const char* RunStateName(RunState state) {
    switch (state) {
        case RunState::Scanning:      return "SCANNING";
        case RunState::Classifying:   return "CLASSIFYING";
        case RunState::Staging:       return "STAGING";
        case RunState::ManifestReady: return "MANIFEST_READY";
        case RunState::Submitted:     return "SUBMITTED";
        case RunState::Skipped:       return "SKIPPED";
        case RunState::Failed:        return "FAILED";
    }
    return "UNKNOWN";
}

int ExitCodeFor(const RunSummary& summary) {
    if (summary.Succeeded()) return kExitOk;
    return summary.outcome.kind == ErrorKind::Config ? kExitUsage : kExitRunFailed;
}

void LogRunSummary(const RunSummary& s) {
    LogInfo("Run %s finished: %s%s", s.label.c_str(), RunStateName(s.state), s.dry_run ? " (dry run)" : "");
    LogInfo("  files: considered=%llu in_window=%llu skipped=%llu archived=%llu raw=%llu dropped=%llu",
            ULL(s.files_considered), ULL(s.files_in_window), ULL(s.files_skipped),
            ULL(s.files_archived), ULL(s.files_raw), ULL(s.files_dropped));
    LogInfo("  groups: archived=%llu raw=%llu dropped=%llu, bundles staged=%llu",
            ULL(s.groups_archived), ULL(s.groups_raw), ULL(s.groups_dropped), ULL(s.bundles_staged));
    for (const auto& d : s.dropped) {
        LogInfo("  dropped %s [%s]: %s", DirLabel(d.relative_dir), ErrorKindName(d.kind), d.reason.c_str());
    }
    if (s.state == RunState::Submitted) {
        LogInfo("  task id: %s", s.task_id.c_str());
    } else if (s.state == RunState::Failed) {
        LogInfo("  failure [%s]: %s", ErrorKindName(s.outcome.kind), s.outcome.message().c_str());
    }
}

RunOptions RunOptions::FromConfig(const config::RunConfig& cfg) {
    RunOptions opt;
    opt.scan_root = cfg.scan_root;
    opt.staging_root = cfg.staging_root;
    opt.size_threshold_bytes = cfg.size_threshold_bytes;
    opt.compression = cfg.bundle_compression;
    opt.dry_run = cfg.dry_run;
    opt.workers = cfg.workers;
    opt.submit_timeout = std::chrono::seconds(cfg.submit_timeout_seconds);

    opt.manifest.remote_source_root = cfg.remote_source_root;
    opt.manifest.remote_dest_root = cfg.remote_dest_root;
    opt.manifest.remote_staging_root = cfg.EffectiveRemoteStagingRoot();
    opt.manifest.timestamp_rename = cfg.timestamp_rename;

    opt.policy.verify_checksum = cfg.verify_checksum;
    opt.policy.preserve_timestamp = cfg.preserve_timestamp;
    opt.policy.sync_level = cfg.EffectiveSyncLevel();

    opt.source_endpoint = cfg.source_endpoint;
    opt.dest_endpoint = cfg.dest_endpoint;
    return opt;
}

TransferRun::TransferRun(RunOptions opt, TimeWindow window, std::shared_ptr<ITransferSubmitter> submitter)
    : opt_(std::move(opt)), window_(std::move(window)), submitter_(std::move(submitter)) {
    summary_.label = window_.Label();
    summary_.dry_run = opt_.dry_run;
}

void TransferRun::Transition(RunState next) {
    if (static_cast<int>(next) < static_cast<int>(summary_.state)) {
        LogError("refusing state change %s -> %s", RunStateName(summary_.state), RunStateName(next));
        return;
    }
    LogDebug("run %s: %s -> %s", summary_.label.c_str(), RunStateName(summary_.state), RunStateName(next));
    const RunState prev = summary_.state;
    summary_.state = next;
    if (observer_) observer_->OnStateChange(prev, next);
}

RunSummary TransferRun::Fail(Result why) {
    LogError("Run %s failed [%s]: %s", summary_.label.c_str(), ErrorKindName(why.kind), why.message().c_str());
    summary_.outcome = std::move(why);
    Transition(RunState::Failed);
    LogRunSummary(summary_);
    return summary_;
}

void TransferRun::DropGroup(PlannedGroup& planned, ErrorKind kind, const std::string& reason) {
    planned.dropped = true;
    summary_.groups_dropped++;
    summary_.files_dropped += planned.classified.group.FileCount();
    summary_.dropped.push_back(StagingFailure{
        .relative_dir = planned.classified.group.relative_dir, .kind = kind, .reason = reason});
    LogError("Dropping group %s: %s", DirLabel(planned.classified.group.relative_dir), reason.c_str());
}

void TransferRun::DiscardStagedBundles(const ArchiveBuilder& builder) {
    for (const auto& bundle : bundles_) {
        auto r = builder.Discard(bundle);
        if (!r.is_ok()) LogError("%s", r.message().c_str());
    }
    bundles_.clear();
}

Result TransferRun::ScanPhase(std::vector<DirectoryGroup>& groups) {
    const ChangeScanner scanner(ChangeScanner::Options{.cancel = opt_.cancel});
    ChangeScanner::Stats stats;

    auto r = scanner.Walk(
        opt_.scan_root, window_,
        [&groups](DirectoryGroup&& g) { groups.push_back(std::move(g)); },
        [this](const ScanSkip& s) { summary_.skipped.push_back(s); },
        &stats);

    summary_.files_considered = stats.files_considered;
    summary_.files_in_window = stats.files_in_window;
    summary_.files_skipped = stats.files_skipped;
    if (!r.is_ok()) return r;

    LogInfo("Scan of %s: %llu directories, %llu files, %llu in window, %llu skipped, %zu groups",
            opt_.scan_root.c_str(), ULL(stats.directories_visited), ULL(stats.files_considered),
            ULL(stats.files_in_window), ULL(stats.files_skipped), groups.size());
    return Result::Ok();
}

void TransferRun::ClassifyPhase(std::vector<DirectoryGroup>&& groups) {
    const GroupClassifier classifier(opt_.size_threshold_bytes);
    planned_.reserve(groups.size());

    for (auto& g : groups) {
        PlannedGroup planned;
        planned.classified.group.relative_dir = g.relative_dir;

        auto c = classifier.Classify(std::move(g));
        if (!c) {
            DropGroup(planned, ErrorKind::Classification, c.error());
            continue;
        }
        planned.classified = std::move(*c);

        const auto& cg = planned.classified;
        if (cg.strategy == Strategy::Archive) {
            LogInfo("Tarring %s (%zu files, avg %.1f KB)", DirLabel(cg.group.relative_dir),
                    cg.group.FileCount(), static_cast<double>(cg.mean_bytes) / 1024.0);
        } else {
            LogInfo("Transferring raw %s (%zu files, avg %.1f MB)", DirLabel(cg.group.relative_dir),
                    cg.group.FileCount(), static_cast<double>(cg.mean_bytes) / (1024.0 * 1024.0));
        }
        planned_.push_back(std::move(planned));
    }
}

Result TransferRun::StagePhase(const ArchiveBuilder& builder) {
    // Flattening can map two directories onto one bundle name ("x/y" and
    // "x_y"); the first in scan order keeps it.
    std::map<std::string, fs::path> names;
    std::vector<size_t> archive_idx;
    for (size_t i = 0; i < planned_.size(); ++i) {
        PlannedGroup& planned = planned_[i];
        if (planned.classified.strategy != Strategy::Archive) continue;

        const fs::path& rel = planned.classified.group.relative_dir;
        const auto [it, inserted] = names.emplace(builder.BundleName(rel), rel);
        if (!inserted) {
            DropGroup(planned, ErrorKind::Staging,
                      "bundle name " + it->first + " already taken by " + DirLabel(it->second));
            continue;
        }
        archive_idx.push_back(i);
    }
    if (archive_idx.empty()) return Result::Ok();

    if (opt_.dry_run) {
        for (size_t i : archive_idx) {
            planned_[i].bundle = builder.Plan(planned_[i].classified);
            LogInfo("[DRY RUN] Would stage %s (%zu files)", planned_[i].bundle.local_path.c_str(),
                    planned_[i].bundle.member_count);
        }
        return Result::Ok();
    }

    std::vector<std::future<Result>> pending;
    pending.reserve(archive_idx.size());
    {
        WorkerPool pool(std::min<size_t>(std::max(opt_.workers, 1u), archive_idx.size()));
        for (size_t i : archive_idx) {
            // Each task owns planned_[i].bundle exclusively until its future is read.
            PlannedGroup* slot = &planned_[i];
            pending.push_back(pool.Submit([this, &builder, slot]() {
                if (Cancelled()) {
                    return Result::Fail(ErrorKind::Cancelled, ECANCELED, "cancelled before staging");
                }
                return builder.Build(slot->classified, slot->bundle);
            }));
        }

        for (size_t k = 0; k < archive_idx.size(); ++k) {
            Result r;
            try {
                r = pending[k].get();
            } catch (const std::exception& e) {
                r = Result::Fail(ErrorKind::Staging, -1, e.what());
            }

            PlannedGroup& planned = planned_[archive_idx[k]];
            if (r.is_ok()) {
                bundles_.push_back(planned.bundle);
                summary_.bundles_staged++;
                if (observer_) observer_->OnBundleStaged(planned.bundle);
            } else if (r.kind == ErrorKind::Cancelled) {
                planned.dropped = true;
            } else {
                DropGroup(planned, r.kind, r.message());
            }
        }
    }

    if (Cancelled()) {
        return Result::Fail(ErrorKind::Cancelled, ECANCELED, "cancelled during staging");
    }
    return Result::Ok();
}

void TransferRun::BuildManifest() {
    ManifestBuilder builder(opt_.manifest, window_.Label(), opt_.policy);
    builder.SetEndpoints(opt_.source_endpoint, opt_.dest_endpoint);

    // Scan order, so the same tree and window always give the same manifest.
    for (const auto& planned : planned_) {
        if (planned.dropped) continue;
        const auto& cg = planned.classified;
        if (cg.strategy == Strategy::Archive) {
            builder.AddArchive(planned.bundle);
            summary_.groups_archived++;
            summary_.files_archived += cg.group.FileCount();
        } else {
            summary_.files_raw += builder.AddRaw(cg.group);
            summary_.groups_raw++;
        }
    }
    manifest_ = builder.Finish();
}

RunSummary TransferRun::Execute() {
    if (executed_) {
        LogWarn("run %s already executed", summary_.label.c_str());
        return summary_;
    }
    executed_ = true;

    LogInfo("Run %s: %s .. %s under %s%s", summary_.label.c_str(),
            FormatLocal(window_.Start(), "%Y-%m-%d %H:%M:%S").c_str(),
            FormatLocal(window_.End(), "%Y-%m-%d %H:%M:%S").c_str(), opt_.scan_root.c_str(),
            opt_.dry_run ? " [DRY RUN]" : "");

    std::vector<DirectoryGroup> groups;
    if (auto r = ScanPhase(groups); !r.is_ok()) return Fail(std::move(r));

    Transition(RunState::Classifying);
    ClassifyPhase(std::move(groups));
    if (Cancelled()) {
        return Fail(Result::Fail(ErrorKind::Cancelled, ECANCELED, "cancelled after scan"));
    }

    Transition(RunState::Staging);
    const ArchiveBuilder builder(ArchiveBuilder::Options{
        .staging_root = opt_.staging_root,
        .window_label = window_.Label(),
        .compression = opt_.compression,
        .compute_checksum = opt_.policy.verify_checksum,
    });
    if (auto r = StagePhase(builder); !r.is_ok()) {
        DiscardStagedBundles(builder);
        return Fail(std::move(r));
    }

    Transition(RunState::ManifestReady);
    BuildManifest();
    LogInfo("Manifest %s: %zu items (%zu bundles, %zu raw files), %llu bytes", manifest_.label.c_str(),
            manifest_.items.size(), manifest_.CountOf(TransferKind::ArchivedBundle),
            manifest_.CountOf(TransferKind::RawFile), ULL(manifest_.TotalBytes()));

    if (manifest_.empty()) {
        if (summary_.groups_dropped > 0) {
            return Fail(Result::Fail(ErrorKind::Staging, -1, "every group was dropped, nothing left to submit"));
        }
        LogInfo("No files modified in window %s, nothing to transfer", summary_.label.c_str());
        Transition(RunState::Skipped);
        LogRunSummary(summary_);
        return summary_;
    }

    if (opt_.dry_run) {
        for (const auto& item : manifest_.items) {
            LogInfo("[DRY RUN] Would transfer: %s -> %s", item.source.c_str(), item.destination.c_str());
        }
        LogRunSummary(summary_);
        return summary_;
    }

    if (Cancelled()) {
        DiscardStagedBundles(builder);
        return Fail(Result::Fail(ErrorKind::Cancelled, ECANCELED, "cancelled before submission"));
    }

    auto handle = SubmitWithTimeout(submitter_, manifest_, opt_.submit_timeout);
    if (!handle) {
        if (!bundles_.empty()) {
            LogWarn("Keeping %zu staged bundles under %s for a retry", bundles_.size(),
                    builder.BundleDir().c_str());
        }
        return Fail(Result::Fail(ErrorKind::Submission, -1,
                                 "submission of " + handle.error().label + " failed: " + handle.error().cause));
    }

    summary_.task_id = handle->task_id;
    Transition(RunState::Submitted);
    LogInfo("Submitted %s as task %s", manifest_.label.c_str(), summary_.task_id.c_str());
    if (!bundles_.empty()) {
        LogInfo("Bundles under %s can be removed once task %s has completed", builder.BundleDir().c_str(),
                summary_.task_id.c_str());
    }
    LogRunSummary(summary_);
    return summary_;
}

} // namespace batchsync
