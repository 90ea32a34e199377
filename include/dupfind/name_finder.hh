#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "dupfind/file_record.hh"
#include "dupfind/name_key.hh"
#include "dupfind/result.hh"

namespace dupfind {

inline namespace detail_v1 {

/**
 * @brief groups records by normalized file name, optionally by size too.
 * names that normalize to an empty key are never grouped.
 */
class name_bucketer_t {
  // key, size (0 unless equal size is required)
  using bucket_key_t = std::pair<std::string, uint64_t>;

  ext_mode_t _mode;
  bool _require_equal_size;
  std::map<bucket_key_t, std::vector<file_record_t>> _buckets;
  std::size_t _file_cnt = 0;

 public:
  name_bucketer_t(ext_mode_t mode, bool require_equal_size) noexcept
      : _mode(mode), _require_equal_size(require_equal_size) {}

  void add(file_record_t record);

  // forget every record below min_size
  void drop_below(uint64_t min_size);

  /**
   * @brief groups of two members or more, leaves the bucketer empty
   */
  std::vector<duplicate_group_t> take_groups();

  inline std::size_t file_count() const noexcept { return _file_cnt; }
};

}  // namespace detail_v1

}  // namespace dupfind
