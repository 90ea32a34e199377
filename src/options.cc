#include "dupfind/options.hh"

#include <algorithm>
#include <system_error>
#include <thread>

#include "dupfind/digest.hh"
#include "dupfind/error.hh"

namespace dupfind {

inline namespace detail_v1 {

namespace fs = std::filesystem;

uint32_t default_jobs() noexcept {
  return std::max(1U, std::thread::hardware_concurrency());
}

void options_t::validate() const {
  if (ignore_ext && keep_ext) {
    throw config_error_t("--ignore-ext and --keep-ext are mutually exclusive");
  }
  if (time_budget_min == 0) {
    throw config_error_t("time budget must be > 0 minutes");
  }
  if (jobs == 0 || jobs > 256) {
    throw config_error_t("jobs must be > 0 and <= 256");
  }
  if (mode == find_mode_t::size) {
    digest_by_name(digest_name);
  }
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw config_error_t("invalid root directory: " + root.string() +
                         (ec ? " - " + ec.message() : ""));
  }
}

}  // namespace detail_v1

}  // namespace dupfind
