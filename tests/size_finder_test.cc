#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <stop_token>
#include <string>
#include <thread>

#include "dupfind/config.hh"
#include "dupfind/digest.hh"
#include "dupfind/gate.hh"
#include "dupfind/progress.hh"
#include "dupfind/size_finder.hh"
#include "test_util.hh"

using namespace dupfind;
using namespace std::chrono_literals;
namespace fs = std::filesystem;
using dupfind::test::record;

TEST(SizeBucketerTest, SingletonsAreNotCandidates) {
  size_bucketer_t sizes;
  sizes.add(record("/a", 100, 0));
  sizes.add(record("/b", 200, 1));
  sizes.add(record("/c", 100, 2));
  sizes.add(record("/d", 300, 3));
  EXPECT_EQ(sizes.file_count(), 4U);
  EXPECT_EQ(sizes.bucket_count(), 3U);

  const auto candidates = sizes.take_candidates();
  ASSERT_EQ(candidates.size(), 1U);
  EXPECT_EQ(candidates[0].size, 100U);
  ASSERT_EQ(candidates[0].files.size(), 2U);
  EXPECT_EQ(candidates[0].files[0].path(), "/a");
  EXPECT_EQ(candidates[0].files[1].path(), "/c");
  EXPECT_EQ(sizes.file_count(), 0U);
  EXPECT_EQ(sizes.bucket_count(), 0U);
}

TEST(SizeBucketerTest, DropBelowForgetsSmallBuckets) {
  size_bucketer_t sizes;
  sizes.add(record("/a", 100, 0));
  sizes.add(record("/b", 100, 1));
  sizes.add(record("/c", 500, 2));
  sizes.add(record("/d", 500, 3));
  sizes.drop_below(200);
  EXPECT_EQ(sizes.file_count(), 2U);

  // later additions still land in the surviving bucket
  sizes.add(record("/e", 500, 4));
  const auto candidates = sizes.take_candidates();
  ASSERT_EQ(candidates.size(), 1U);
  EXPECT_EQ(candidates[0].size, 500U);
  EXPECT_EQ(candidates[0].files.size(), 3U);
}

class DigestVerifierTest : public ::testing::Test {
 protected:
  test::temp_dir_t dir;
  std::atomic<uint64_t> min_size{1};
  gate_t gate;
  progress_board_t board;
  digest_verifier_t verifier{digest_by_name("sha256"), min_size, gate, board};

  size_bucket_t bucket(uint64_t size, const std::vector<fs::path> &paths) {
    size_bucket_t out;
    out.size = size;
    uint64_t seq = 0;
    for (const auto &path : paths) {
      out.files.emplace_back(path, size, fs::file_time_type{}, seq++);
    }
    return out;
  }
};

TEST_F(DigestVerifierTest, EqualContentGrouped) {
  const auto a = dir.write("a.txt", 100, 'x');
  const auto b = dir.write("copy of a.txt", 100, 'x');
  const auto c = dir.write("c.txt", 100, 'y');
  verifier.verify(bucket(100, {a, b, c}), {});

  const auto groups = verifier.take_groups();
  ASSERT_EQ(groups.size(), 1U);
  EXPECT_EQ(groups[0].kind(), group_kind_t::digest);
  ASSERT_EQ(groups[0].files().size(), 2U);
  EXPECT_EQ(groups[0].files()[0].path(), a);
  EXPECT_EQ(groups[0].files()[1].path(), b);
  EXPECT_EQ(groups[0].wasted(), 100U);
  EXPECT_EQ(groups[0].key().size(), 64U);

  EXPECT_EQ(verifier.stats().prefix_hashed.load(), 3U);
  // c.txt has a unique leading block
  EXPECT_EQ(verifier.stats().digested.load(), 2U);

  const auto progress = board.snapshot();
  EXPECT_EQ(progress.hash_done, 3U);
  EXPECT_EQ(progress.hash_bytes_done, 300U);
}

TEST_F(DigestVerifierTest, DifferentLeadingBlockNeverDigested) {
  const auto a = dir.write("a.bin", 8192, 'a');
  const auto b = dir.write("b.bin", 8192, 'b');
  verifier.verify(bucket(8192, {a, b}), {});
  EXPECT_TRUE(verifier.take_groups().empty());
  EXPECT_EQ(verifier.stats().prefix_hashed.load(), 2U);
  EXPECT_EQ(verifier.stats().digested.load(), 0U);
}

TEST_F(DigestVerifierTest, ReadBytesKeptApartFromSettledBytes) {
  const auto a = dir.write("a.bin", 8192, 'a');
  const auto b = dir.write("b.bin", 8192, 'b');
  verifier.verify(bucket(8192, {a, b}), {});
  const auto progress = board.snapshot();
  EXPECT_EQ(progress.hash_done, 2U);
  EXPECT_EQ(progress.hash_bytes_done, 16384U);
  // only the two leading blocks were read
  EXPECT_EQ(progress.hash_bytes_read, 2 * prefix_blk_sz);
}

TEST_F(DigestVerifierTest, SettleBelowCreditsQueuedBucketsOnce) {
  const auto a = dir.write("a.bin", 100, 'x');
  const auto b = dir.write("b.bin", 100, 'x');
  const auto c = dir.write("c.bin", 2000, 'x');
  const auto d = dir.write("d.bin", 2000, 'x');
  const auto small = bucket(100, {a, b});
  const auto large = bucket(2000, {c, d});
  verifier.expect(small);
  verifier.expect(large);

  min_size = 1000;
  verifier.settle_below(1000);
  auto progress = board.snapshot();
  EXPECT_EQ(progress.hash_done, 2U);
  EXPECT_EQ(progress.hash_bytes_done, 200U);
  EXPECT_EQ(progress.hash_bytes_read, 0U);

  // the worker skips the settled bucket without counting it again
  verifier.verify(small, {});
  verifier.settle_below(1000);
  verifier.verify(large, {});
  progress = board.snapshot();
  EXPECT_EQ(progress.hash_done, 4U);
  EXPECT_EQ(progress.hash_bytes_done, 4200U);

  const auto groups = verifier.take_groups();
  ASSERT_EQ(groups.size(), 1U);
  EXPECT_EQ(groups[0].files()[0].size(), 2000U);
}

TEST_F(DigestVerifierTest, SameLeadingBlockDifferentTail) {
  std::string lhs(8192, 'a');
  std::string rhs = lhs;
  rhs.back() = 'z';
  const auto a = dir.write("a.bin", lhs);
  const auto b = dir.write("b.bin", rhs);
  verifier.verify(bucket(8192, {a, b}), {});
  EXPECT_TRUE(verifier.take_groups().empty());
  EXPECT_EQ(verifier.stats().digested.load(), 2U);
}

TEST_F(DigestVerifierTest, UnreadableMemberLoggedAndLeftOut) {
  const auto a = dir.write("a.bin", 100, 'x');
  const auto b = dir.write("b.bin", 100, 'x');
  const auto gone = dir.path() / "gone.bin";
  const auto c = dir.write("c.bin", 100, 'x');

  test::log_capture_t log;
  verifier.verify(bucket(100, {a, gone, b, c}), {});
  const auto groups = verifier.take_groups();
  ASSERT_EQ(groups.size(), 1U);
  EXPECT_EQ(groups[0].files().size(), 3U);
  EXPECT_EQ(verifier.stats().unreadable.load(), 1U);
  EXPECT_NE(log.str().find("skip unreadable"), std::string::npos);
  EXPECT_NE(log.str().find("gone.bin"), std::string::npos);
  EXPECT_EQ(board.snapshot().hash_done, 4U);
}

TEST_F(DigestVerifierTest, BucketBelowRaisedThresholdSkipped) {
  const auto a = dir.write("a.bin", 100, 'x');
  const auto b = dir.write("b.bin", 100, 'x');
  min_size = 1000;
  verifier.verify(bucket(100, {a, b}), {});
  EXPECT_TRUE(verifier.take_groups().empty());
  EXPECT_EQ(verifier.stats().prefix_hashed.load(), 0U);
  EXPECT_EQ(board.snapshot().hash_done, 2U);
}

TEST_F(DigestVerifierTest, StopAbandonsBucket) {
  const auto a = dir.write("a.bin", 100, 'x');
  const auto b = dir.write("b.bin", 100, 'x');
  std::stop_source stop;
  stop.request_stop();
  verifier.verify(bucket(100, {a, b}), stop.get_token());
  EXPECT_TRUE(verifier.take_groups().empty());
  EXPECT_EQ(verifier.stats().prefix_hashed.load(), 0U);
}

TEST_F(DigestVerifierTest, ClosedGateHoldsWorker) {
  const auto a = dir.write("a.bin", 100, 'x');
  const auto b = dir.write("b.bin", 100, 'x');
  gate.close();
  std::thread worker([&] { verifier.verify(bucket(100, {a, b}), {}); });
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(verifier.stats().prefix_hashed.load(), 0U);
  gate.open();
  worker.join();
  EXPECT_EQ(verifier.take_groups().size(), 1U);
}

TEST_F(DigestVerifierTest, StopReleasesClosedGate) {
  const auto a = dir.write("a.bin", 100, 'x');
  const auto b = dir.write("b.bin", 100, 'x');
  gate.close();
  std::stop_source stop;
  std::thread worker(
      [&] { verifier.verify(bucket(100, {a, b}), stop.get_token()); });
  std::this_thread::sleep_for(20ms);
  stop.request_stop();
  worker.join();
  EXPECT_TRUE(verifier.take_groups().empty());
}
