#include "util/time_window.hpp"

#include <cstdio>

namespace batchsync {

namespace {

using std::chrono::duration_cast;
using std::chrono::nanoseconds;
using std::chrono::seconds;

constexpr nanoseconds kOneNano{1};

bool ToLocalTm(Timestamp t, std::tm& out) {
    const std::time_t secs = static_cast<std::time_t>(
        std::chrono::floor<seconds>(t).time_since_epoch().count());
    return localtime_r(&secs, &out) != nullptr;
}

// mktime() on a normalized copy; day/month overflow is folded by libc.
std::optional<Timestamp> FromLocalTm(std::tm tm) {
    tm.tm_isdst = -1;
    const std::time_t secs = std::mktime(&tm);
    if (secs == static_cast<std::time_t>(-1)) return std::nullopt;
    return Timestamp(duration_cast<nanoseconds>(seconds(secs)));
}

std::optional<Timestamp> LocalMidnight(std::tm tm, int day_offset) {
    tm.tm_mday += day_offset;
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    return FromLocalTm(tm);
}

std::optional<Timestamp> FirstOfMonth(std::tm tm, int month_offset) {
    tm.tm_mon += month_offset;
    tm.tm_mday = 1;
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    return FromLocalTm(tm);
}

} // namespace

Timestamp FromTimespec(const struct timespec& ts) {
    return Timestamp(seconds(ts.tv_sec) + nanoseconds(ts.tv_nsec));
}

struct timespec ToTimespec(Timestamp t) {
    const auto since = t.time_since_epoch();
    const auto secs = std::chrono::floor<seconds>(since);
    struct timespec ts{};
    ts.tv_sec = static_cast<std::time_t>(secs.count());
    ts.tv_nsec = static_cast<long>(duration_cast<nanoseconds>(since - secs).count());
    return ts;
}

std::string FormatLocal(Timestamp t, const char* fmt) {
    std::tm tm{};
    if (!ToLocalTm(t, tm)) return {};
    char buf[128]{};
    const size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::expected<Timestamp, std::string> ParseLocalTimestamp(std::string_view s,
                                                          bool date_means_end_of_day) {
    const std::string in(s);
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    int consumed = 0;
    bool has_time = false;

    if (std::sscanf(in.c_str(), "%4d-%2d-%2d%n", &year, &mon, &day, &consumed) != 3) {
        return std::unexpected("invalid timestamp '" + in + "' (expected YYYY-MM-DD[ HH:MM:SS])");
    }
    if (static_cast<size_t>(consumed) != in.size()) {
        const char sep = in[static_cast<size_t>(consumed)];
        int rest = 0;
        if ((sep != ' ' && sep != 'T') ||
            std::sscanf(in.c_str() + consumed + 1, "%2d:%2d:%2d%n", &hour, &min, &sec, &rest) != 3 ||
            static_cast<size_t>(consumed + 1 + rest) != in.size()) {
            return std::unexpected("invalid timestamp '" + in + "' (expected YYYY-MM-DD[ HH:MM:SS])");
        }
        has_time = true;
    }

    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 || min < 0 ||
        min > 59 || sec < 0 || sec > 60) {
        return std::unexpected("timestamp out of range: '" + in + "'");
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;

    if (!has_time && date_means_end_of_day) {
        const auto next = LocalMidnight(tm, 1);
        if (!next) return std::unexpected("cannot convert '" + in + "' to local time");
        return *next - kOneNano;
    }

    const auto t = FromLocalTm(tm);
    if (!t) return std::unexpected("cannot convert '" + in + "' to local time");
    return *t;
}

std::expected<TimeWindow, std::string> TimeWindow::Create(Timestamp start,
                                                          Timestamp end,
                                                          std::string label) {
    if (end < start) {
        return std::unexpected("window start " + FormatLocal(start, "%Y-%m-%d %H:%M:%S") +
                               " is after window end " + FormatLocal(end, "%Y-%m-%d %H:%M:%S"));
    }
    if (label.empty()) {
        return std::unexpected("window label must not be empty");
    }
    return TimeWindow(start, end, std::move(label));
}

std::expected<TimeWindow, std::string> TimeWindow::Yesterday(Timestamp now) {
    std::tm tm{};
    if (!ToLocalTm(now, tm)) return std::unexpected("localtime_r failed");

    const auto today = LocalMidnight(tm, 0);
    const auto yesterday = LocalMidnight(tm, -1);
    if (!today || !yesterday) return std::unexpected("mktime failed");

    return Create(*yesterday, *today - kOneNano, "Daily_" + FormatLocal(*yesterday, "%Y-%m-%d"));
}

std::expected<TimeWindow, std::string> TimeWindow::CurrentMonthToDate(Timestamp now) {
    std::tm tm{};
    if (!ToLocalTm(now, tm)) return std::unexpected("localtime_r failed");

    const auto first = FirstOfMonth(tm, 0);
    if (!first) return std::unexpected("mktime failed");

    // Runs on different days of one month cover different windows, so the end
    // is part of the label.
    return Create(*first, now,
                  "CurrentMonth_" + FormatLocal(*first, "%B_%Y") + "_to_" + FormatLocal(now, "%Y%m%d_%H%M%S"));
}

std::expected<TimeWindow, std::string> TimeWindow::PreviousMonth(Timestamp now) {
    std::tm tm{};
    if (!ToLocalTm(now, tm)) return std::unexpected("localtime_r failed");

    const auto first_this = FirstOfMonth(tm, 0);
    const auto first_prev = FirstOfMonth(tm, -1);
    if (!first_this || !first_prev) return std::unexpected("mktime failed");

    return Create(*first_prev, *first_this - kOneNano,
                  "Monthly_" + FormatLocal(*first_prev, "%B_%Y"));
}

std::expected<TimeWindow, std::string> TimeWindow::Explicit(Timestamp start, Timestamp end) {
    return Create(start, end,
                  "Window_" + FormatLocal(start, "%Y%m%d_%H%M%S") + "_" +
                      FormatLocal(end, "%Y%m%d_%H%M%S"));
}

std::optional<WindowPolicy> ParseWindowPolicy(std::string_view name) {
    if (name == "yesterday") return WindowPolicy::Yesterday;
    if (name == "current-month") return WindowPolicy::CurrentMonth;
    if (name == "previous-month") return WindowPolicy::PreviousMonth;
    if (name == "archive-and-transfer") return WindowPolicy::ArchiveAndTransfer;
    return std::nullopt;
}

const char* WindowPolicyName(WindowPolicy policy) {
    switch (policy) {
        case WindowPolicy::Yesterday:          return "yesterday";
        case WindowPolicy::CurrentMonth:       return "current-month";
        case WindowPolicy::PreviousMonth:      return "previous-month";
        case WindowPolicy::ArchiveAndTransfer: return "archive-and-transfer";
    }
    return "unknown";
}

std::expected<TimeWindow, std::string> ResolveWindow(WindowPolicy policy,
                                                     Timestamp now,
                                                     std::optional<Timestamp> explicit_start,
                                                     std::optional<Timestamp> explicit_end) {
    switch (policy) {
        case WindowPolicy::Yesterday:
            return TimeWindow::Yesterday(now);
        case WindowPolicy::CurrentMonth:
            return TimeWindow::CurrentMonthToDate(now);
        case WindowPolicy::PreviousMonth:
            return TimeWindow::PreviousMonth(now);
        case WindowPolicy::ArchiveAndTransfer:
            if (explicit_start && explicit_end) {
                return TimeWindow::Explicit(*explicit_start, *explicit_end);
            }
            return TimeWindow::Yesterday(now);
    }
    return std::unexpected("unknown window policy");
}

} // namespace batchsync
