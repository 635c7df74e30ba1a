#include <gtest/gtest.h>

#include "batchsync/change_scanner.hpp"
#include "testing.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;
using batchsync::ChangeScanner;
using batchsync::ErrorKind;
using batchsync::ScanResult;
using batchsync::TimeWindow;
using batchsync::Timestamp;

constexpr std::chrono::nanoseconds kNs{1};

class ChangeScannerTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    const Timestamp start = testutil::LocalTime(2024, 3, 10);
    const Timestamp end = testutil::LocalTime(2024, 3, 11) - kNs;
    const Timestamp inside = testutil::LocalTime(2024, 3, 10, 12);
    const Timestamp outside = testutil::LocalTime(2024, 2, 1);

    fs::path Root() const { return tmp.Sub("root"); }

    TimeWindow Window() const { return *TimeWindow::Create(start, end, "Daily_2024-03-10"); }

    ScanResult Scan(const ChangeScanner& scanner = ChangeScanner()) {
        ScanResult out;
        auto r = batchsync::ScanTree(scanner, Root(), Window(), out);
        EXPECT_TRUE(r.is_ok()) << r.message();
        return out;
    }

    static std::vector<std::string> Names(const batchsync::DirectoryGroup& g) {
        std::vector<std::string> names;
        for (const auto& f : g.files) names.push_back(f.name);
        return names;
    }
};

TEST_F(ChangeScannerTests, BoundariesAreInclusiveToTheNanosecond) {
    testutil::WriteFileWithMtime(Root() / "at_start", "x", start);
    testutil::WriteFileWithMtime(Root() / "at_end", "x", end);
    testutil::WriteFileWithMtime(Root() / "before_start", "x", start - kNs);
    testutil::WriteFileWithMtime(Root() / "after_end", "x", end + kNs);

    const auto out = Scan();
    ASSERT_EQ(out.groups.size(), 1u);
    EXPECT_EQ(Names(out.groups[0]), (std::vector<std::string>{"at_end", "at_start"}));
    EXPECT_TRUE(out.groups[0].relative_dir.empty());
    EXPECT_EQ(out.stats.files_considered, 4u);
    EXPECT_EQ(out.stats.files_in_window, 2u);
}

TEST_F(ChangeScannerTests, GroupsByImmediateParentInPreOrder) {
    testutil::WriteFileWithMtime(Root() / "top.txt", "x", inside);
    testutil::WriteFileWithMtime(Root() / "b" / "two.txt", "x", inside);
    testutil::WriteFileWithMtime(Root() / "a" / "one.txt", "x", inside);
    testutil::WriteFileWithMtime(Root() / "a" / "nested" / "deep.txt", "x", inside);
    testutil::WriteFileWithMtime(Root() / "c" / "old.txt", "x", outside);

    const auto out = Scan();
    ASSERT_EQ(out.groups.size(), 4u);
    EXPECT_EQ(out.groups[0].relative_dir, fs::path());
    EXPECT_EQ(out.groups[1].relative_dir, fs::path("a"));
    EXPECT_EQ(out.groups[2].relative_dir, fs::path("a/nested"));
    EXPECT_EQ(out.groups[3].relative_dir, fs::path("b"));
    EXPECT_EQ(out.stats.groups, 4u);
    EXPECT_EQ(out.stats.files_in_window, 4u);
}

TEST_F(ChangeScannerTests, RepeatedScansAreIdentical) {
    for (const char* name : {"z", "m", "a", "q"}) {
        testutil::WriteFileWithMtime(Root() / "d" / name, "x", inside);
    }

    const auto first = Scan();
    const auto second = Scan();
    ASSERT_EQ(first.groups.size(), 1u);
    ASSERT_EQ(second.groups.size(), 1u);
    EXPECT_EQ(Names(first.groups[0]), (std::vector<std::string>{"a", "m", "q", "z"}));
    EXPECT_EQ(Names(first.groups[0]), Names(second.groups[0]));
}

TEST_F(ChangeScannerTests, DanglingSymlinkIsSkippedAndScanContinues) {
    testutil::WriteFileWithMtime(Root() / "good.txt", "x", inside);
    fs::create_symlink(Root() / "gone.txt", Root() / "broken.txt");

    const auto out = Scan();
    ASSERT_EQ(out.groups.size(), 1u);
    EXPECT_EQ(Names(out.groups[0]), (std::vector<std::string>{"good.txt"}));
    ASSERT_EQ(out.skipped.size(), 1u);
    EXPECT_EQ(out.skipped[0].path.filename(), fs::path("broken.txt"));
    EXPECT_EQ(out.stats.files_skipped, 1u);
}

TEST_F(ChangeScannerTests, SymlinkedDirectoryIsNotEntered) {
    testutil::WriteFileWithMtime(tmp.Sub("elsewhere") / "outside_tree.txt", "x", inside);
    fs::create_directories(Root());
    fs::create_directory_symlink(tmp.Sub("elsewhere"), Root() / "link");
    // A self-referencing loop must not recurse forever either.
    fs::create_directory_symlink(Root(), Root() / "loop");

    const auto out = Scan();
    EXPECT_TRUE(out.groups.empty());
    EXPECT_TRUE(out.skipped.empty());
}

TEST_F(ChangeScannerTests, SymlinkToFileIsFollowed) {
    testutil::WriteFileWithMtime(tmp.Sub("real.bin"), "payload", inside);
    fs::create_directories(Root());
    fs::create_symlink(tmp.Sub("real.bin"), Root() / "alias.bin");

    const auto out = Scan();
    ASSERT_EQ(out.groups.size(), 1u);
    EXPECT_EQ(out.groups[0].files[0].name, "alias.bin");
    EXPECT_EQ(out.groups[0].files[0].size, 7u);
}

TEST_F(ChangeScannerTests, EmptyTreeYieldsNoGroups) {
    fs::create_directories(Root() / "empty" / "deeper");
    const auto out = Scan();
    EXPECT_TRUE(out.groups.empty());
    EXPECT_EQ(out.stats.directories_visited, 3u);
}

TEST_F(ChangeScannerTests, MissingRootIsAConfigError) {
    ScanResult out;
    auto r = batchsync::ScanTree(ChangeScanner(), tmp.Sub("nope"), Window(), out);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

TEST_F(ChangeScannerTests, RaisedCancelFlagStopsTheWalk) {
    testutil::WriteFileWithMtime(Root() / "a.txt", "x", inside);
    std::atomic_bool cancel{true};
    ChangeScanner scanner(ChangeScanner::Options{.cancel = &cancel});

    ScanResult out;
    auto r = batchsync::ScanTree(scanner, Root(), Window(), out);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Cancelled);
    EXPECT_TRUE(out.groups.empty());
}

TEST_F(ChangeScannerTests, GroupsAreStreamedBeforeWalkReturns) {
    testutil::WriteFileWithMtime(Root() / "a" / "1", "x", inside);
    testutil::WriteFileWithMtime(Root() / "b" / "2", "x", inside);

    std::vector<std::string> seen;
    auto r = ChangeScanner().Walk(
        Root(), Window(),
        [&seen](batchsync::DirectoryGroup&& g) { seen.push_back(g.relative_dir.string()); },
        nullptr);
    ASSERT_TRUE(r.is_ok()) << r.message();
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b"}));
}

} // namespace
