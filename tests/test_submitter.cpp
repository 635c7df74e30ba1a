#include <gtest/gtest.h>

#include "batchsync/submitter.hpp"
#include "testing.hpp"
#include "util/manifest_parser.hpp"

#include <chrono>
#include <filesystem>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

namespace fs = std::filesystem;
using batchsync::ITransferSubmitter;
using batchsync::OutboxSubmitter;
using batchsync::SubmissionError;
using batchsync::SubmitGate;
using batchsync::TaskHandle;
using batchsync::TransferKind;
using batchsync::TransferManifest;

TransferManifest SampleManifest() {
    TransferManifest m;
    m.label = "Daily_2024-03-10";
    m.items.push_back({.source = "/s/a.tar", .destination = "/d/a.tar", .kind = TransferKind::ArchivedBundle,
                       .size_bytes = 10});
    m.items.push_back({.source = "/s/b/big.bin", .destination = "/d/b/big.bin", .kind = TransferKind::RawFile,
                       .size_bytes = 20});
    return m;
}

// Sleeps, then publishes by setting a flag if the gate still allows it.
class SlowSubmitter final : public ITransferSubmitter {
  public:
    explicit SlowSubmitter(std::chrono::milliseconds delay) : delay_(delay) {}
    std::expected<TaskHandle, SubmissionError> Submit(const TransferManifest& m, SubmitGate& gate) override {
        std::this_thread::sleep_for(delay_);
        if (!gate.TryCommit()) return std::unexpected(SubmissionError{.label = m.label, .cause = "abandoned"});
        published = true;
        return TaskHandle{.task_id = "slow", .label = m.label};
    }

    std::atomic<bool> published{false};

  private:
    std::chrono::milliseconds delay_;
};

// Commits at once, then takes a while to return.
class CommitThenStallSubmitter final : public ITransferSubmitter {
  public:
    std::expected<TaskHandle, SubmissionError> Submit(const TransferManifest& m, SubmitGate& gate) override {
        if (!gate.TryCommit()) return std::unexpected(SubmissionError{.label = m.label, .cause = "abandoned"});
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        return TaskHandle{.task_id = "late", .label = m.label};
    }
};

class ThrowingSubmitter final : public ITransferSubmitter {
  public:
    std::expected<TaskHandle, SubmissionError> Submit(const TransferManifest&, SubmitGate&) override {
        throw std::runtime_error("connection reset");
    }
};

TEST(OutboxSubmitterTests, PublishesManifestUnderLabelAndTaskId) {
    testutil::TemporaryDirectory tmp;
    const fs::path outbox = tmp.Sub("outbox");
    OutboxSubmitter submitter(outbox);

    const auto m = SampleManifest();
    SubmitGate gate;
    auto handle = submitter.Submit(m, gate);
    ASSERT_TRUE(handle.has_value()) << handle.error().cause;
    EXPECT_EQ(handle->label, m.label);
    EXPECT_EQ(handle->task_id.size(), 32u);
    EXPECT_EQ(handle->task_id, OutboxSubmitter::TaskIdFor(batchsync::SerializeManifest(m)));

    const fs::path published = submitter.PathFor(m.label, handle->task_id);
    ASSERT_TRUE(fs::exists(published));
    EXPECT_FALSE(fs::exists(published.string() + ".tmp"));

    auto parsed = batchsync::ManifestParser().Parse(testutil::ReadFileToString(published));
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    EXPECT_EQ(parsed->items.size(), 2u);
}

TEST(OutboxSubmitterTests, ResubmittingSameManifestIsIdempotent) {
    testutil::TemporaryDirectory tmp;
    OutboxSubmitter submitter(tmp.Sub("outbox"));

    SubmitGate first_gate, second_gate;
    auto first = submitter.Submit(SampleManifest(), first_gate);
    auto second = submitter.Submit(SampleManifest(), second_gate);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->task_id, second->task_id);

    size_t files = 0;
    for ([[maybe_unused]] const auto& e : fs::directory_iterator(tmp.Sub("outbox"))) ++files;
    EXPECT_EQ(files, 1u);
}

TEST(OutboxSubmitterTests, UnwritableOutboxIsASubmissionError) {
    testutil::TemporaryDirectory tmp;
    // A regular file where the outbox directory should be.
    testutil::WriteFile(tmp.Sub("outbox"), "not a directory");
    OutboxSubmitter submitter(tmp.Sub("outbox"));

    SubmitGate gate;
    auto handle = submitter.Submit(SampleManifest(), gate);
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().label, "Daily_2024-03-10");
    EXPECT_FALSE(handle.error().cause.empty());
}

TEST(OutboxSubmitterTests, AbandonedGatePublishesNothing) {
    testutil::TemporaryDirectory tmp;
    const fs::path outbox = tmp.Sub("outbox");
    ASSERT_TRUE(fs::create_directories(outbox));
    OutboxSubmitter submitter(outbox);

    SubmitGate gate;
    ASSERT_TRUE(gate.TryAbandon());
    auto handle = submitter.Submit(SampleManifest(), gate);
    ASSERT_FALSE(handle.has_value());
    EXPECT_NE(handle.error().cause.find("abandoned"), std::string::npos);

    size_t files = 0;
    for ([[maybe_unused]] const auto& e : fs::directory_iterator(outbox)) ++files;
    EXPECT_EQ(files, 0u);
}

TEST(SubmitGateTests, FirstDecisionWins) {
    SubmitGate committed;
    EXPECT_TRUE(committed.TryCommit());
    EXPECT_TRUE(committed.TryCommit());
    EXPECT_FALSE(committed.TryAbandon());
    EXPECT_FALSE(committed.Abandoned());

    SubmitGate abandoned;
    EXPECT_TRUE(abandoned.TryAbandon());
    EXPECT_FALSE(abandoned.TryCommit());
    EXPECT_TRUE(abandoned.Abandoned());
}

TEST(SubmitWithTimeoutTests, ReturnsHandleWithinDeadline) {
    auto submitter = std::make_shared<SlowSubmitter>(std::chrono::milliseconds(1));
    auto handle = batchsync::SubmitWithTimeout(submitter, SampleManifest(), std::chrono::seconds(5));
    ASSERT_TRUE(handle.has_value()) << handle.error().cause;
    EXPECT_EQ(handle->task_id, "slow");
}

TEST(SubmitWithTimeoutTests, TimesOutSlowSubmitter) {
    auto submitter = std::make_shared<SlowSubmitter>(std::chrono::milliseconds(500));
    auto handle = batchsync::SubmitWithTimeout(submitter, SampleManifest(), std::chrono::milliseconds(20));
    ASSERT_FALSE(handle.has_value());
    EXPECT_NE(handle.error().cause.find("timed out"), std::string::npos);
    EXPECT_EQ(handle.error().label, "Daily_2024-03-10");
}

TEST(SubmitWithTimeoutTests, TimedOutSubmissionNeverPublishesLater) {
    auto submitter = std::make_shared<SlowSubmitter>(std::chrono::milliseconds(200));
    auto handle = batchsync::SubmitWithTimeout(submitter, SampleManifest(), std::chrono::milliseconds(20));
    ASSERT_FALSE(handle.has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    EXPECT_FALSE(submitter->published.load());
}

TEST(SubmitWithTimeoutTests, CommittedSubmissionIsAwaitedPastDeadline) {
    auto submitter = std::make_shared<CommitThenStallSubmitter>();
    auto handle = batchsync::SubmitWithTimeout(submitter, SampleManifest(), std::chrono::milliseconds(20));
    ASSERT_TRUE(handle.has_value()) << handle.error().cause;
    EXPECT_EQ(handle->task_id, "late");
}

TEST(SubmitWithTimeoutTests, ExceptionBecomesSubmissionError) {
    auto submitter = std::make_shared<ThrowingSubmitter>();

    auto with_deadline = batchsync::SubmitWithTimeout(submitter, SampleManifest(), std::chrono::seconds(5));
    ASSERT_FALSE(with_deadline.has_value());
    EXPECT_EQ(with_deadline.error().cause, "connection reset");

    auto inline_call = batchsync::SubmitWithTimeout(submitter, SampleManifest(), std::chrono::milliseconds(0));
    ASSERT_FALSE(inline_call.has_value());
    EXPECT_EQ(inline_call.error().cause, "connection reset");
}

TEST(SubmitWithTimeoutTests, MissingSubmitterFails) {
    auto handle = batchsync::SubmitWithTimeout(nullptr, SampleManifest(), std::chrono::seconds(1));
    EXPECT_FALSE(handle.has_value());
}

} // namespace
