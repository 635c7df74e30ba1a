#pragma once

#include "batchsync/archive_builder.hpp"
#include "batchsync/file_record.hpp"
#include "batchsync/manifest_builder.hpp"
#include "batchsync/submitter.hpp"
#include "util/result.hpp"
#include "util/run_config.hpp"
#include "util/time_window.hpp"
#include "util/transfer_manifest.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace batchsync {

// Strictly forward: Scanning -> Classifying -> Staging -> ManifestReady ->
// one of Submitted / Skipped / Failed. A dry run stops at ManifestReady.
enum class RunState {
    Scanning,
    Classifying,
    Staging,
    ManifestReady,
    Submitted,
    Skipped,
    Failed,
};

const char* RunStateName(RunState state);

// A group that was left out of the manifest.
struct StagingFailure {
    std::filesystem::path relative_dir;
    ErrorKind kind = ErrorKind::Staging;
    std::string reason;
};

struct RunSummary {
    std::string label;
    RunState state = RunState::Scanning;
    bool dry_run = false;

    std::uint64_t files_considered = 0;
    std::uint64_t files_in_window = 0;
    std::uint64_t files_skipped = 0;
    std::uint64_t files_archived = 0;
    std::uint64_t files_raw = 0;
    std::uint64_t files_dropped = 0;

    std::uint64_t groups_archived = 0;
    std::uint64_t groups_raw = 0;
    std::uint64_t groups_dropped = 0;
    std::uint64_t bundles_staged = 0;

    std::vector<ScanSkip> skipped;
    std::vector<StagingFailure> dropped;

    std::string task_id;   // set when Submitted
    Result outcome;        // failure detail when Failed

    bool Succeeded() const { return state != RunState::Failed; }
};

void LogRunSummary(const RunSummary& summary);

inline constexpr int kExitOk = 0;
inline constexpr int kExitRunFailed = 1;
inline constexpr int kExitUsage = 2;

// Process exit status for a finished run. A run that failed on its
// configuration (for example a missing scan root) reports kExitUsage.
int ExitCodeFor(const RunSummary& summary);

struct RunOptions {
    std::filesystem::path scan_root;
    std::filesystem::path staging_root;
    std::uint64_t size_threshold_bytes = config::kDefaultSizeThresholdBytes;
    config::BundleCompression compression = config::BundleCompression::None;
    bool dry_run = false;
    unsigned workers = config::kDefaultWorkers;
    std::chrono::milliseconds submit_timeout{config::kDefaultSubmitTimeoutSeconds * 1000};

    ManifestBuilder::Options manifest{};
    SyncPolicy policy{};
    std::string source_endpoint;
    std::string dest_endpoint;

    // Raised from outside (signal handler, tests); checked between steps.
    const std::atomic_bool* cancel = nullptr;

    static RunOptions FromConfig(const config::RunConfig& cfg);
};

// Notified on the thread that runs Execute().
class IRunObserver {
  public:
    virtual ~IRunObserver() = default;
    virtual void OnStateChange(RunState from, RunState to) = 0;
    virtual void OnBundleStaged(const ArchiveBundle& bundle) = 0;
};

// One run: one scan, one manifest, at most one submission.
class TransferRun {
  public:
    TransferRun(RunOptions opt, TimeWindow window, std::shared_ptr<ITransferSubmitter> submitter);

    // Never throws; every failure ends up in the summary.
    RunSummary Execute();

    void SetObserver(IRunObserver* observer) { observer_ = observer; }

    RunState State() const { return summary_.state; }
    const TransferManifest& Manifest() const { return manifest_; }
    const std::vector<ArchiveBundle>& Bundles() const { return bundles_; }

  private:
    struct PlannedGroup {
        ClassifiedGroup classified;
        ArchiveBundle bundle;   // valid when strategy is Archive and staging succeeded
        bool dropped = false;
    };

    void Transition(RunState next);
    bool Cancelled() const { return opt_.cancel && opt_.cancel->load(std::memory_order_relaxed); }
    RunSummary Fail(Result why);
    void DropGroup(PlannedGroup& planned, ErrorKind kind, const std::string& reason);
    void DiscardStagedBundles(const ArchiveBuilder& builder);

    Result ScanPhase(std::vector<DirectoryGroup>& groups);
    void ClassifyPhase(std::vector<DirectoryGroup>&& groups);
    Result StagePhase(const ArchiveBuilder& builder);
    void BuildManifest();

    RunOptions opt_;
    TimeWindow window_;
    std::shared_ptr<ITransferSubmitter> submitter_;
    IRunObserver* observer_ = nullptr;

    std::vector<PlannedGroup> planned_;
    std::vector<ArchiveBundle> bundles_;
    TransferManifest manifest_;
    RunSummary summary_;
    bool executed_ = false;
};

} // namespace batchsync
