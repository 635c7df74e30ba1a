#pragma once

#include "util/transfer_manifest.hpp"

#include <atomic>
#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>

namespace batchsync {

struct TaskHandle {
    std::string task_id;   // opaque, for later status queries
    std::string label;
};

struct SubmissionError {
    std::string label;
    std::string cause;
};

// Decides, once, between a submitter about to make its submission visible
// and a caller that has stopped waiting for it. Whichever side arrives first
// wins; the other side observes the decision.
class SubmitGate {
  public:
    // Called by the submitter right before its first externally visible
    // effect. false means the caller gave up: undo local work and return an
    // error.
    bool TryCommit();
    // Called by the waiting side. false means the submitter has already
    // committed, so its outcome has to be awaited.
    bool TryAbandon();

    bool Abandoned() const { return state_.load() == kAbandoned; }

  private:
    static constexpr int kOpen = 0;
    static constexpr int kCommitted = 1;
    static constexpr int kAbandoned = 2;
    std::atomic<int> state_{kOpen};
};

// The remote transfer service as the engine sees it: the whole manifest goes
// in as one unit, a task handle or an error comes back. Implementations call
// gate.TryCommit() before publishing and publish nothing if it fails.
class ITransferSubmitter {
  public:
    virtual ~ITransferSubmitter() = default;
    virtual std::expected<TaskHandle, SubmissionError> Submit(const TransferManifest& manifest,
                                                              SubmitGate& gate) = 0;
};

// Publishes the manifest as <outbox>/<label>-<task id>.json for an external
// transfer agent. The file appears atomically; the task id is derived from
// the document, so resubmitting an identical manifest is idempotent.
class OutboxSubmitter final : public ITransferSubmitter {
  public:
    explicit OutboxSubmitter(std::filesystem::path outbox_dir) : outbox_dir_(std::move(outbox_dir)) {}

    std::expected<TaskHandle, SubmissionError> Submit(const TransferManifest& manifest,
                                                      SubmitGate& gate) override;

    static std::string TaskIdFor(const std::string& document);
    std::filesystem::path PathFor(const std::string& label, const std::string& task_id) const;

  private:
    std::filesystem::path outbox_dir_;
};

// Runs Submit() with a deadline. Exceptions derived from std::exception are
// turned into SubmissionError. On timeout the gate is abandoned and the call
// fails; a submitter that reaches TryCommit() afterwards publishes nothing.
// If the submitter committed before the deadline, its late outcome is
// awaited and returned instead. A zero timeout calls Submit() inline.
std::expected<TaskHandle, SubmissionError> SubmitWithTimeout(
    std::shared_ptr<ITransferSubmitter> submitter,
    const TransferManifest& manifest,
    std::chrono::milliseconds timeout);

} // namespace batchsync
