#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/time_window.hpp"

#include <chrono>

namespace {

using batchsync::TimeWindow;
using batchsync::Timestamp;
using testutil::LocalTime;

constexpr std::chrono::nanoseconds kNs{1};

TEST(TimeWindowTests, ContainsIsInclusiveAtBothEnds) {
    const Timestamp start = LocalTime(2024, 3, 10);
    const Timestamp end = LocalTime(2024, 3, 10, 23, 59, 59);
    auto w = TimeWindow::Create(start, end, "w");
    ASSERT_TRUE(w.has_value()) << w.error();

    EXPECT_TRUE(w->Contains(start));
    EXPECT_TRUE(w->Contains(end));
    EXPECT_FALSE(w->Contains(start - kNs));
    EXPECT_FALSE(w->Contains(end + kNs));
}

TEST(TimeWindowTests, CreateRejectsInvertedBoundsAndEmptyLabel) {
    const Timestamp t = LocalTime(2024, 3, 10);
    EXPECT_FALSE(TimeWindow::Create(t, t - kNs, "w").has_value());
    EXPECT_FALSE(TimeWindow::Create(t, t, "").has_value());
    EXPECT_TRUE(TimeWindow::Create(t, t, "instant").has_value());
}

TEST(TimeWindowTests, YesterdayCoversThePreviousDay) {
    auto w = TimeWindow::Yesterday(LocalTime(2024, 3, 1, 8, 30));
    ASSERT_TRUE(w.has_value()) << w.error();

    EXPECT_EQ(w->Start(), LocalTime(2024, 2, 29));
    EXPECT_EQ(w->End(), LocalTime(2024, 3, 1) - kNs);
    EXPECT_EQ(w->Label(), "Daily_2024-02-29");
}

TEST(TimeWindowTests, CurrentMonthRunsUpToNow) {
    const Timestamp now = LocalTime(2024, 7, 15, 12, 0, 5);
    auto w = TimeWindow::CurrentMonthToDate(now);
    ASSERT_TRUE(w.has_value()) << w.error();

    EXPECT_EQ(w->Start(), LocalTime(2024, 7, 1));
    EXPECT_EQ(w->End(), now);
    EXPECT_EQ(w->Label(), "CurrentMonth_July_2024_to_20240715_120005");
}

TEST(TimeWindowTests, CurrentMonthLabelsDifferWhenNowDiffers) {
    auto early = TimeWindow::CurrentMonthToDate(LocalTime(2024, 7, 10, 12));
    auto late = TimeWindow::CurrentMonthToDate(LocalTime(2024, 7, 20, 12));
    ASSERT_TRUE(early.has_value()) << early.error();
    ASSERT_TRUE(late.has_value()) << late.error();

    EXPECT_EQ(early->Start(), late->Start());
    EXPECT_NE(early->Label(), late->Label());
    EXPECT_EQ(early->Label(), "CurrentMonth_July_2024_to_20240710_120000");
    EXPECT_EQ(late->Label(), "CurrentMonth_July_2024_to_20240720_120000");
}

TEST(TimeWindowTests, PreviousMonthWrapsAcrossYear) {
    auto w = TimeWindow::PreviousMonth(LocalTime(2024, 1, 20));
    ASSERT_TRUE(w.has_value()) << w.error();

    EXPECT_EQ(w->Start(), LocalTime(2023, 12, 1));
    EXPECT_EQ(w->End(), LocalTime(2024, 1, 1) - kNs);
    EXPECT_EQ(w->Label(), "Monthly_December_2023");
}

TEST(TimeWindowTests, ExplicitWindowIsLabelledFromBounds) {
    auto w = TimeWindow::Explicit(LocalTime(2024, 5, 1), LocalTime(2024, 5, 2, 6, 7, 8));
    ASSERT_TRUE(w.has_value()) << w.error();
    EXPECT_EQ(w->Label(), "Window_20240501_000000_20240502_060708");
}

TEST(TimeWindowTests, ParseLocalTimestampAcceptsDateAndDateTime) {
    auto d = batchsync::ParseLocalTimestamp("2024-05-01");
    ASSERT_TRUE(d.has_value()) << d.error();
    EXPECT_EQ(*d, LocalTime(2024, 5, 1));

    auto eod = batchsync::ParseLocalTimestamp("2024-05-01", true);
    ASSERT_TRUE(eod.has_value()) << eod.error();
    EXPECT_EQ(*eod, LocalTime(2024, 5, 2) - kNs);

    auto dt = batchsync::ParseLocalTimestamp("2024-05-01 13:14:15");
    ASSERT_TRUE(dt.has_value()) << dt.error();
    EXPECT_EQ(*dt, LocalTime(2024, 5, 1, 13, 14, 15));

    auto iso = batchsync::ParseLocalTimestamp("2024-05-01T13:14:15", true);
    ASSERT_TRUE(iso.has_value()) << iso.error();
    EXPECT_EQ(*iso, LocalTime(2024, 5, 1, 13, 14, 15));
}

TEST(TimeWindowTests, ParseLocalTimestampRejectsGarbage) {
    EXPECT_FALSE(batchsync::ParseLocalTimestamp("").has_value());
    EXPECT_FALSE(batchsync::ParseLocalTimestamp("yesterday").has_value());
    EXPECT_FALSE(batchsync::ParseLocalTimestamp("2024-13-01").has_value());
    EXPECT_FALSE(batchsync::ParseLocalTimestamp("2024-05-01 25:00:00").has_value());
    EXPECT_FALSE(batchsync::ParseLocalTimestamp("2024-05-01 10:00").has_value());
    EXPECT_FALSE(batchsync::ParseLocalTimestamp("2024-05-01x").has_value());
}

TEST(TimeWindowTests, ResolveArchiveAndTransferPrefersExplicitBounds) {
    const Timestamp now = LocalTime(2024, 6, 10, 9);
    const Timestamp s = LocalTime(2024, 6, 1);
    const Timestamp e = LocalTime(2024, 6, 3);

    auto explicit_w = batchsync::ResolveWindow(batchsync::WindowPolicy::ArchiveAndTransfer, now, s, e);
    ASSERT_TRUE(explicit_w.has_value());
    EXPECT_EQ(explicit_w->Start(), s);
    EXPECT_EQ(explicit_w->End(), e);

    auto fallback = batchsync::ResolveWindow(batchsync::WindowPolicy::ArchiveAndTransfer, now, s, std::nullopt);
    ASSERT_TRUE(fallback.has_value());
    EXPECT_EQ(fallback->Label(), "Daily_2024-06-09");
}

TEST(TimeWindowTests, PolicyNamesRoundTrip) {
    for (auto p : {batchsync::WindowPolicy::Yesterday, batchsync::WindowPolicy::CurrentMonth,
                   batchsync::WindowPolicy::PreviousMonth, batchsync::WindowPolicy::ArchiveAndTransfer}) {
        EXPECT_EQ(batchsync::ParseWindowPolicy(batchsync::WindowPolicyName(p)), p);
    }
    EXPECT_FALSE(batchsync::ParseWindowPolicy("weekly").has_value());
}

TEST(TimeWindowTests, TimespecConversionKeepsNanoseconds) {
    struct timespec ts{};
    ts.tv_sec = 1700000000;
    ts.tv_nsec = 123456789;
    const Timestamp t = batchsync::FromTimespec(ts);
    const struct timespec back = batchsync::ToTimespec(t);
    EXPECT_EQ(back.tv_sec, ts.tv_sec);
    EXPECT_EQ(back.tv_nsec, ts.tv_nsec);
}

} // namespace
