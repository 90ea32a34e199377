#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dupfind/file_record.hh"
#include "dupfind/progress.hh"

namespace dupfind {

inline namespace detail_v1 {

enum class group_kind_t {
  digest,  // equal size and equal content digest
  name     // equal normalized name key
};

/**
 * @brief reported set of duplicates, members ordered by discovery
 */
class duplicate_group_t {
  group_kind_t _kind;
  std::string _key;
  std::vector<file_record_t> _files;
  uint64_t _wasted = 0;

 public:
  /**
   * @param kind decides how wasted bytes are counted
   * @param key hex digest, or normalized name key
   * @param files at least two members
   */
  duplicate_group_t(group_kind_t kind, std::string key,
                    std::vector<file_record_t> files);

  inline group_kind_t kind() const noexcept { return _kind; }
  inline const std::string &key() const noexcept { return _key; }
  inline const std::vector<file_record_t> &files() const noexcept {
    return _files;
  }
  // bytes freed by keeping a single member
  inline uint64_t wasted() const noexcept { return _wasted; }
  inline uint64_t first_seq() const noexcept { return _files.front().seq(); }
  // size of the largest member
  uint64_t size() const noexcept;
};

/**
 * @brief size x (n - 1) for digest groups; for name groups the sum of every
 * member except the largest
 */
uint64_t wasted_bytes(group_kind_t kind, const std::vector<file_record_t> &files);

/**
 * @brief descending wasted bytes, then descending member count, then first
 * discovered first
 */
std::vector<duplicate_group_t> rank_groups(std::vector<duplicate_group_t> groups);

struct scan_report_t {
  std::vector<duplicate_group_t> groups;
  progress_t progress;
  uint64_t total_wasted = 0;
  // false when the run was cancelled, groups are then the ones fully verified
  bool complete = true;
};

class result_aggregator_t {
  std::vector<duplicate_group_t> _groups;

 public:
  // groups with fewer than two members are dropped
  void add(duplicate_group_t group);
  void add(std::vector<duplicate_group_t> groups);

  /**
   * @brief drop members below min_size, then groups left with fewer than
   * two members
   */
  void drop_below(uint64_t min_size);

  inline std::size_t size() const noexcept { return _groups.size(); }

  scan_report_t finish(const progress_t &progress, bool complete);
};

}  // namespace detail_v1

}  // namespace dupfind
