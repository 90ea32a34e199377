#include "dupfind/placeholder.hh"

#include <sys/stat.h>

#include <cerrno>

namespace dupfind {

inline namespace detail_v1 {

bool is_cloud_placeholder(const std::filesystem::path &path,
                          std::error_code &ec) noexcept {
  ec.clear();
  struct stat st {};
  if (::lstat(path.c_str(), &st) != 0) {
    ec.assign(errno, std::generic_category());
    return false;
  }
  if (!S_ISREG(st.st_mode)) {
    return false;
  }
  return st.st_size > 0 && st.st_blocks == 0;
}

}  // namespace detail_v1

}  // namespace dupfind
