#pragma once

#include <chrono>
#include <ctime>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace batchsync {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::nanoseconds>;

Timestamp FromTimespec(const struct timespec& ts);
struct timespec ToTimespec(Timestamp t);

// strftime() on the local-time breakdown of t. Empty on conversion failure.
std::string FormatLocal(Timestamp t, const char* fmt);

// "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS", local time.
// A bare date means its first nanosecond, or its last one when
// date_means_end_of_day is set.
std::expected<Timestamp, std::string> ParseLocalTimestamp(std::string_view s,
                                                          bool date_means_end_of_day = false);

// Inclusive [start, end] interval of modification times.
class TimeWindow {
  public:
    static std::expected<TimeWindow, std::string> Create(Timestamp start,
                                                         Timestamp end,
                                                         std::string label);

    // Previous calendar day, 00:00:00 to 23:59:59.999999999 local time.
    static std::expected<TimeWindow, std::string> Yesterday(Timestamp now);
    // First of the current month, 00:00:00, up to now. Labelled
    // CurrentMonth_<Month>_<YYYY>_to_<now as %Y%m%d_%H%M%S>.
    static std::expected<TimeWindow, std::string> CurrentMonthToDate(Timestamp now);
    // The whole previous calendar month.
    static std::expected<TimeWindow, std::string> PreviousMonth(Timestamp now);
    // Caller-supplied bounds, labelled from the bounds themselves.
    static std::expected<TimeWindow, std::string> Explicit(Timestamp start, Timestamp end);

    Timestamp Start() const { return start_; }
    Timestamp End() const { return end_; }
    const std::string& Label() const { return label_; }

    bool Contains(Timestamp t) const { return start_ <= t && t <= end_; }

  private:
    TimeWindow(Timestamp start, Timestamp end, std::string label)
        : start_(start), end_(end), label_(std::move(label)) {}

    Timestamp start_;
    Timestamp end_;
    std::string label_;
};

enum class WindowPolicy {
    Yesterday,
    CurrentMonth,
    PreviousMonth,
    ArchiveAndTransfer,
};

// CLI subcommand names: yesterday, current-month, previous-month, archive-and-transfer.
std::optional<WindowPolicy> ParseWindowPolicy(std::string_view name);
const char* WindowPolicyName(WindowPolicy policy);

// Resolve a policy into a concrete window. ArchiveAndTransfer uses the
// explicit bounds when both are given and falls back to Yesterday otherwise.
std::expected<TimeWindow, std::string> ResolveWindow(WindowPolicy policy,
                                                     Timestamp now,
                                                     std::optional<Timestamp> explicit_start,
                                                     std::optional<Timestamp> explicit_end);

} // namespace batchsync
