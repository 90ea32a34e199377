#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "dupfind/config.hh"
#include "dupfind/name_key.hh"

namespace dupfind {

inline namespace detail_v1 {

enum class find_mode_t {
  size,  // equal size and content digest
  name   // equal normalized file name
};

uint32_t default_jobs() noexcept;

// parameters of one run, checked by validate() before anything is scanned
struct options_t {
  std::filesystem::path root = "/";
  find_mode_t mode = find_mode_t::size;
  uint64_t min_size = default_min_size;
  uint32_t time_budget_min = default_budget_min;
  bool no_excludes = false;
  std::vector<std::filesystem::path> add_excludes;
  bool include_cloud = false;
  // mutually exclusive, neither set means ignore
  bool ignore_ext = false;
  bool keep_ext = false;
  bool name_require_equal_size = false;
  uint32_t jobs = default_jobs();
  std::string digest_name = "sha256";

  inline ext_mode_t ext_mode() const noexcept {
    return keep_ext ? ext_mode_t::keep : ext_mode_t::ignore;
  }

  /**
   * @throws config_error_t on conflicting or out of range options
   */
  void validate() const;
};

}  // namespace detail_v1

}  // namespace dupfind
