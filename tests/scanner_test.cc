#include <gtest/gtest.h>
#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <set>
#include <stop_token>
#include <string>
#include <system_error>
#include <vector>

#include "dupfind/exclusion.hh"
#include "dupfind/placeholder.hh"
#include "dupfind/scanner.hh"
#include "test_util.hh"

using namespace dupfind;
namespace fs = std::filesystem;

namespace {

std::vector<file_record_t> drain(scanner_t &scanner) {
  std::vector<file_record_t> records;
  while (auto record = scanner.next()) {
    records.emplace_back(std::move(*record));
  }
  return records;
}

std::set<std::string> names(const std::vector<file_record_t> &records) {
  std::set<std::string> out;
  for (const auto &record : records) {
    out.insert(record.path().filename().string());
  }
  return out;
}

}  // namespace

TEST(ScannerTest, WalksNestedDirectories) {
  test::temp_dir_t dir;
  dir.write("a.bin", 100, 'a');
  dir.write("x/b.bin", 200, 'b');
  dir.write("x/y/z/c.bin", 300, 'c');
  const exclusion_set_t excludes;
  scanner_t scanner(dir.path(), excludes, 1, false);

  const auto records = drain(scanner);
  EXPECT_EQ(names(records), (std::set<std::string>{"a.bin", "b.bin", "c.bin"}));
  EXPECT_TRUE(scanner.done());

  // discovery index is dense and increasing
  for (std::size_t i = 0; i < records.size(); ++i) {
    EXPECT_EQ(records[i].seq(), i);
    EXPECT_TRUE(records[i].path().is_absolute());
  }

  progress_t progress;
  scanner.fill(progress);
  EXPECT_EQ(progress.files_kept, 3U);
  EXPECT_EQ(progress.files_visited, 3U);
  EXPECT_EQ(progress.bytes_visited, 600U);
  EXPECT_EQ(progress.dirs_visited, 4U);
  EXPECT_EQ(progress.dirs_pending, 0U);
}

TEST(ScannerTest, SkipsSmallAndEmptyFiles) {
  test::temp_dir_t dir;
  dir.write("empty.bin", "");
  dir.write("small.bin", 10, 's');
  dir.write("large.bin", 1000, 'l');
  const exclusion_set_t excludes;
  scanner_t scanner(dir.path(), excludes, 100, false);

  EXPECT_EQ(names(drain(scanner)), std::set<std::string>{"large.bin"});
  progress_t progress;
  scanner.fill(progress);
  EXPECT_EQ(progress.files_visited, 3U);
  EXPECT_EQ(progress.files_skipped, 2U);
  // small files still count towards the walked volume
  EXPECT_EQ(progress.bytes_visited, 1010U);
}

TEST(ScannerTest, EmptyFileSkippedEvenWithoutThreshold) {
  test::temp_dir_t dir;
  dir.write("empty.bin", "");
  const exclusion_set_t excludes;
  scanner_t scanner(dir.path(), excludes, 0, false);
  EXPECT_TRUE(drain(scanner).empty());
}

TEST(ScannerTest, SkipsSymlinks) {
  test::temp_dir_t dir;
  const auto target = dir.write("real.bin", 100, 'r');
  fs::create_symlink(target, dir.path() / "link.bin");
  fs::create_directory_symlink(dir.mkdir("sub"), dir.path() / "sublink");
  dir.write("sub/inner.bin", 100, 'i');
  const exclusion_set_t excludes;
  scanner_t scanner(dir.path(), excludes, 1, false);

  const auto records = drain(scanner);
  EXPECT_EQ(names(records), (std::set<std::string>{"real.bin", "inner.bin"}));
  EXPECT_EQ(records.size(), 2U);
}

TEST(ScannerTest, HonorsExclusions) {
  test::temp_dir_t dir;
  dir.write("keep/a.bin", 100, 'a');
  dir.write("Skip/b.bin", 100, 'b');
  dir.write("Skip/deep/c.bin", 100, 'c');
  dir.write("skipped.bin", 100, 'd');
  exclusion_set_t excludes;
  excludes.add(dir.path() / "skip");
  excludes.add(dir.path() / "SKIPPED.bin");
  scanner_t scanner(dir.path(), excludes, 1, false);

  EXPECT_EQ(names(drain(scanner)), std::set<std::string>{"a.bin"});
}

TEST(ScannerTest, ExcludedRootYieldsNothing) {
  test::temp_dir_t dir;
  dir.write("a.bin", 100, 'a');
  exclusion_set_t excludes;
  excludes.add(dir.path());
  test::log_capture_t log;
  scanner_t scanner(dir.path(), excludes, 1, false);
  EXPECT_TRUE(scanner.done());
  EXPECT_FALSE(scanner.next().has_value());
  EXPECT_NE(log.str().find("root is excluded"), std::string::npos);
}

TEST(ScannerTest, PlaceholderSkippedUnlessIncluded) {
  test::temp_dir_t dir;
  const auto stub = dir.write_sparse("stub.bin", 64 * 1024);
  dir.write("real.bin", 64 * 1024, 'r');
  std::error_code ec;
  if (!is_cloud_placeholder(stub, ec)) {
    GTEST_SKIP() << "filesystem allocates blocks for sparse files";
  }
  ASSERT_FALSE(ec);

  const exclusion_set_t excludes;
  {
    scanner_t scanner(dir.path(), excludes, 1, false);
    EXPECT_EQ(names(drain(scanner)), std::set<std::string>{"real.bin"});
  }
  {
    scanner_t scanner(dir.path(), excludes, 1, true);
    const auto records = drain(scanner);
    ASSERT_EQ(records.size(), 2U);
    const auto it = std::find_if(records.begin(), records.end(),
                                 [](const auto &r) { return r.placeholder(); });
    ASSERT_NE(it, records.end());
    EXPECT_EQ(it->path().filename(), "stub.bin");
  }
}

TEST(ScannerTest, UnreadableDirectoryLoggedAndSkipped) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "permissions are not enforced for root";
  }
  test::temp_dir_t dir;
  dir.write("open/a.bin", 100, 'a');
  dir.write("locked/b.bin", 100, 'b');
  fs::permissions(dir.path() / "locked", fs::perms::none);

  test::log_capture_t log;
  const exclusion_set_t excludes;
  scanner_t scanner(dir.path(), excludes, 1, false);
  EXPECT_EQ(names(drain(scanner)), std::set<std::string>{"a.bin"});
  EXPECT_NE(log.str().find("[warn] skip directory"), std::string::npos);
  EXPECT_NE(log.str().find("permission denied"), std::string::npos);
}

TEST(ScannerTest, RaiseAppliesToRemainingEntries) {
  test::temp_dir_t dir;
  for (int i = 0; i < 4; ++i) {
    dir.write("f" + std::to_string(i) + ".bin", 100, 'x');
  }
  dir.write("big.bin", 1000, 'x');
  const exclusion_set_t excludes;
  scanner_t scanner(dir.path(), excludes, 1, false);

  std::vector<file_record_t> records;
  records.emplace_back(*scanner.next());
  scanner.raise_min_size(500);
  scanner.raise_min_size(10);
  EXPECT_EQ(scanner.min_size(), 500U);
  for (auto &record : drain(scanner)) {
    EXPECT_GE(record.size(), 500U);
    records.emplace_back(std::move(record));
  }
  EXPECT_LE(records.size(), 2U);
}

TEST(ScannerTest, StopAbandonsWalk) {
  test::temp_dir_t dir;
  dir.write("a/1.bin", 100, 'x');
  dir.write("b/2.bin", 100, 'x');
  const exclusion_set_t excludes;
  scanner_t scanner(dir.path(), excludes, 1, false);
  std::stop_source stop;
  stop.request_stop();
  EXPECT_FALSE(scanner.next(stop.get_token()).has_value());
  EXPECT_TRUE(scanner.done());
  EXPECT_FALSE(scanner.next().has_value());
}
