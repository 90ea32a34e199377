#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <vector>

#include "dupfind/exclusion.hh"
#include "dupfind/file_record.hh"
#include "dupfind/progress.hh"

namespace dupfind {

inline namespace detail_v1 {

/**
 * @brief lazy depth-first walk over one directory tree. every call to next()
 * pulls directory entries until a record qualifies or the tree is exhausted.
 * a scanner is single use, a fresh walk needs a fresh scanner.
 *
 * skipped without aborting the walk: excluded paths, symlinks, non-regular
 * files, empty files, files below the threshold, cloud placeholders (unless
 * included) and entries whose metadata cannot be read.
 */
class scanner_t {
  const exclusion_set_t &_excludes;
  uint64_t _min_size;
  bool _include_cloud;

  std::vector<std::filesystem::path> _pending;
  std::filesystem::path _cur_dir;
  std::filesystem::directory_iterator _cur_it;
  bool _in_dir = false;

  uint64_t _seq = 0;
  uint64_t _files_visited = 0;
  uint64_t _files_skipped = 0;
  uint64_t _bytes_visited = 0;
  uint64_t _dirs_visited = 0;

  void open_next_dir();
  std::optional<file_record_t> visit(const std::filesystem::directory_entry &entry);

 public:
  /**
   * @param root directory to walk, made absolute
   * @param excludes consulted for every directory and file, must outlive the
   * scanner
   * @param min_size files smaller than this are skipped
   * @param include_cloud keep placeholder files instead of skipping them
   */
  scanner_t(const std::filesystem::path &root, const exclusion_set_t &excludes,
            uint64_t min_size, bool include_cloud);

  scanner_t(const scanner_t &) = delete;
  scanner_t &operator=(const scanner_t &) = delete;

  /**
   * @brief next qualifying record in traversal order
   *
   * @param st a stop request abandons the remaining walk
   * @return record, or nullopt once the walk is over
   */
  std::optional<file_record_t> next(const std::stop_token &st = {});

  inline bool done() const noexcept { return !_in_dir && _pending.empty(); }

  /**
   * @brief applies to entries not visited yet, a lower value is ignored
   */
  inline void raise_min_size(uint64_t min_size) noexcept {
    if (min_size > _min_size) {
      _min_size = min_size;
    }
  }
  inline uint64_t min_size() const noexcept { return _min_size; }

  // copy the walk counters into a snapshot
  void fill(progress_t &progress) const noexcept;
};

}  // namespace detail_v1

}  // namespace dupfind
