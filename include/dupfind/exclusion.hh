#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dupfind {

inline namespace detail_v1 {

/**
 * @brief set of excluded directory prefixes, matched case-insensitively per
 * path segment. a path is excluded when it equals, or is a descendant of,
 * any entry.
 */
class exclusion_set_t {
  struct node_t {
    std::map<std::string, std::unique_ptr<node_t>> children;
    bool terminal = false;
  };

  node_t _root;
  std::vector<std::filesystem::path> _entries;

 public:
  exclusion_set_t() = default;
  exclusion_set_t(const exclusion_set_t &) = delete;
  exclusion_set_t(exclusion_set_t &&) = default;
  exclusion_set_t &operator=(const exclusion_set_t &) = delete;
  exclusion_set_t &operator=(exclusion_set_t &&) = default;

  /**
   * @brief add a prefix, relative paths are resolved against the current
   * directory. duplicates (ignoring case) are dropped.
   *
   * @return false if the prefix was already present
   */
  bool add(const std::filesystem::path &prefix);

  bool is_excluded(const std::filesystem::path &path) const;

  inline const std::vector<std::filesystem::path> &entries() const noexcept {
    return _entries;
  }
  inline bool empty() const noexcept { return _entries.empty(); }
};

/**
 * @brief well-known system directories plus cloud-sync folders found under
 * the user's home directory
 */
std::vector<std::filesystem::path> default_excludes();

/**
 * @brief build the active set, user additions are honored even when the
 * built-in defaults are disabled
 */
exclusion_set_t make_exclusion_set(
    bool no_excludes, const std::vector<std::filesystem::path> &add_excludes);

}  // namespace detail_v1

}  // namespace dupfind
