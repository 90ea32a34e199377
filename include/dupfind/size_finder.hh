#pragma once

#include <openssl/evp.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <stop_token>
#include <unordered_map>
#include <vector>

#include "dupfind/file_record.hh"
#include "dupfind/gate.hh"
#include "dupfind/progress.hh"
#include "dupfind/result.hh"

namespace dupfind {

inline namespace detail_v1 {

// files of one exact size, in discovery order
struct size_bucket_t {
  uint64_t size = 0;
  std::vector<file_record_t> files;
};

class size_bucketer_t {
  std::unordered_map<uint64_t, std::size_t> _index;
  std::vector<size_bucket_t> _buckets;
  std::size_t _file_cnt = 0;

 public:
  void add(file_record_t record);

  // forget every bucket whose size is below min_size
  void drop_below(uint64_t min_size);

  /**
   * @brief hand out the buckets that can hold duplicates (two members or
   * more), singletons are discarded. leaves the bucketer empty.
   */
  std::vector<size_bucket_t> take_candidates();

  inline std::size_t file_count() const noexcept { return _file_cnt; }
  inline std::size_t bucket_count() const noexcept { return _buckets.size(); }
};

struct verify_stats_t {
  std::atomic<uint64_t> prefix_hashed{0};
  std::atomic<uint64_t> digested{0};
  std::atomic<uint64_t> unreadable{0};
};

/**
 * @brief splits size buckets into digest groups. verify() handles one whole
 * bucket, so a file is only ever read by the worker owning its bucket.
 * members whose leading block hash is unique in the bucket are dropped
 * before the full digest.
 *
 * every member is settled exactly once in the progress board (digested,
 * dropped as unique, unreadable, or skipped below the threshold); bytes
 * really read go to hash_bytes_read.
 */
class digest_verifier_t {
  const EVP_MD *_md;
  const std::atomic<uint64_t> &_min_size;
  gate_t &_gate;
  progress_board_t &_board;
  verify_stats_t _stats;

  std::mutex _mtx;
  std::vector<duplicate_group_t> _groups;

  // unsettled members per bucket size
  std::mutex _ledger_mtx;
  std::map<uint64_t, uint64_t> _unsettled;

  void mark_done(uint64_t size, uint64_t files);
  void mark_read(uint64_t bytes);

 public:
  /**
   * @param md digest algorithm
   * @param min_size live threshold, buckets below it are skipped
   * @param gate workers wait on it before each file
   * @param board receives hash_done / hash_bytes_done
   */
  digest_verifier_t(const EVP_MD *md, const std::atomic<uint64_t> &min_size,
                    gate_t &gate, progress_board_t &board);

  digest_verifier_t(const digest_verifier_t &) = delete;
  digest_verifier_t &operator=(const digest_verifier_t &) = delete;

  /**
   * @brief register a bucket before it is queued, so a raise can settle it
   * while it waits
   */
  void expect(const size_bucket_t &bucket);

  /**
   * @brief settle at once every member of the buckets below min_size, their
   * workers skip them when they get to them
   */
  void settle_below(uint64_t min_size);

  /**
   * @brief verify one bucket, unreadable members are logged and left out.
   * a stop request abandons the bucket without reporting any group of it.
   */
  void verify(size_bucket_t bucket, const std::stop_token &st);

  // collected groups, leaves the verifier empty
  std::vector<duplicate_group_t> take_groups();

  inline const verify_stats_t &stats() const noexcept { return _stats; }
};

}  // namespace detail_v1

}  // namespace dupfind
