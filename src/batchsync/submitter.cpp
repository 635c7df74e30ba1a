#include "batchsync/submitter.hpp"

#include "crypto/sha256.hpp"
#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <future>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace batchsync {

namespace {

constexpr size_t kTaskIdLen = 32;

Result WriteAllToFd(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(err, std::string("write failed: ") + std::strerror(err));
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

} // namespace

bool SubmitGate::TryCommit() {
    int seen = kOpen;
    if (state_.compare_exchange_strong(seen, kCommitted)) return true;
    return seen == kCommitted;
}

bool SubmitGate::TryAbandon() {
    int seen = kOpen;
    if (state_.compare_exchange_strong(seen, kAbandoned)) return true;
    return seen == kAbandoned;
}

std::string OutboxSubmitter::TaskIdFor(const std::string& document) {
    return Sha256Hex(document).substr(0, kTaskIdLen);
}

fs::path OutboxSubmitter::PathFor(const std::string& label, const std::string& task_id) const {
    return outbox_dir_ / (label + "-" + task_id + ".json");
}

std::expected<TaskHandle, SubmissionError> OutboxSubmitter::Submit(const TransferManifest& manifest,
                                                                   SubmitGate& gate) {
    auto fail = [&manifest](std::string cause) {
        return std::unexpected(SubmissionError{.label = manifest.label, .cause = std::move(cause)});
    };

    if (gate.Abandoned()) return fail("abandoned before publishing");

    std::error_code ec;
    fs::create_directories(outbox_dir_, ec);
    if (ec) return fail("cannot create outbox " + outbox_dir_.string() + ": " + ec.message());

    const std::string document = SerializeManifest(manifest);
    const std::string task_id = TaskIdFor(document);
    if (task_id.empty()) return fail("cannot derive task id (sha256 failed)");

    const fs::path final_path = PathFor(manifest.label, task_id);
    const std::string tmp_path = final_path.string() + ".tmp";

    Fd fd;
    auto r = Fd::Open(tmp_path, O_WRONLY | O_CREAT | O_TRUNC, 0644, fd);
    if (!r.is_ok()) return fail(r.message());

    r = WriteAllToFd(fd.Get(), document);
    if (r.is_ok()) r = fd.SyncAndClose();
    if (!r.is_ok()) {
        ::unlink(tmp_path.c_str());
        return fail(r.message());
    }

    if (!gate.TryCommit()) {
        ::unlink(tmp_path.c_str());
        LogWarn("Dropped %s: caller stopped waiting", final_path.c_str());
        return fail("abandoned before publishing");
    }

    if (std::rename(tmp_path.c_str(), final_path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return fail("rename to " + final_path.string() + ": " + std::strerror(err));
    }

    LogDebug("Published %s", final_path.c_str());
    return TaskHandle{.task_id = task_id, .label = manifest.label};
}

std::expected<TaskHandle, SubmissionError> SubmitWithTimeout(
    std::shared_ptr<ITransferSubmitter> submitter,
    const TransferManifest& manifest,
    std::chrono::milliseconds timeout) {
    using Outcome = std::expected<TaskHandle, SubmissionError>;

    if (!submitter) {
        return std::unexpected(SubmissionError{.label = manifest.label, .cause = "no submitter"});
    }

    if (timeout.count() <= 0) {
        SubmitGate gate;
        try {
            return submitter->Submit(manifest, gate);
        } catch (const std::exception& e) {
            return std::unexpected(SubmissionError{.label = manifest.label, .cause = e.what()});
        }
    }

    auto owned = std::make_shared<const TransferManifest>(manifest);
    auto gate = std::make_shared<SubmitGate>();
    std::packaged_task<Outcome()> task([submitter, owned, gate]() { return submitter->Submit(*owned, *gate); });
    std::future<Outcome> fut = task.get_future();
    std::thread(std::move(task)).detach();

    if (fut.wait_for(timeout) != std::future_status::ready) {
        if (gate->TryAbandon()) {
            return std::unexpected(SubmissionError{
                .label = manifest.label,
                .cause = "submission timed out after " + std::to_string(timeout.count()) + " ms"});
        }
        LogWarn("Submission of %s committed at the deadline; waiting for its outcome", manifest.label.c_str());
        fut.wait();
    }

    try {
        return fut.get();
    } catch (const std::exception& e) {
        return std::unexpected(SubmissionError{.label = manifest.label, .cause = e.what()});
    }
}

} // namespace batchsync
