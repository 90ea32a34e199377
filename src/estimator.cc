#include "dupfind/estimator.hh"

#include <sys/stat.h>
#include <sys/statvfs.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "dupfind/config.hh"
#include "dupfind/error.hh"

namespace dupfind {

inline namespace detail_v1 {

namespace fs = std::filesystem;
namespace cn = std::chrono;

budget_estimator_t::budget_estimator_t(cn::minutes budget, uint64_t min_size,
                                       std::optional<uint64_t> tree_size_hint)
    : _budget{budget, min_size, 0}, _est_total(tree_size_hint.value_or(0)) {}

uint64_t suggest_min_size(uint64_t min_size) noexcept {
  const auto doubled = min_size > std::numeric_limits<uint64_t>::max() / 2
                           ? std::numeric_limits<uint64_t>::max()
                           : min_size * 2;
  return std::max<uint64_t>(doubled, raise_floor);
}

budget_check_t budget_estimator_t::observe(const progress_t &progress) {
  budget_check_t check;
  check.suggest_min_size = suggest_min_size(_budget.min_size);

  const auto phase = progress.state;
  if (phase != run_state_t::scanning && phase != run_state_t::hashing) {
    return check;
  }
  const auto work = phase == run_state_t::scanning ? progress.bytes_visited
                                                   : progress.hash_bytes_read;
  if (phase != _phase) {
    _phase = phase;
    _sample_at = cn::milliseconds(0);
    _sample_bytes = 0;
    _resample = false;
  } else if (_resample) {
    _sample_at = progress.phase_elapsed;
    _sample_bytes = work;
    _resample = false;
  }

  const auto window = progress.phase_elapsed - _sample_at;
  if (window < min_eta_sample || work <= _sample_bytes) {
    return check;
  }
  const auto rate = (double)(work - _sample_bytes) /
                    cn::duration<double>(window).count();

  double remaining = 0.0;
  if (phase == run_state_t::scanning) {
    const auto per_dir =
        progress.bytes_visited / std::max<uint64_t>(progress.dirs_visited, 1);
    const auto projection =
        progress.bytes_visited + progress.dirs_pending * per_dir;
    _est_total = std::max({_est_total, projection, progress.bytes_visited});
    // nothing left to list, the walk is about to end
    if (progress.dirs_pending != 0) {
      remaining = (double)(_est_total - progress.bytes_visited);
    }
  } else if (progress.hash_bytes_total > progress.hash_bytes_done) {
    remaining = (double)(progress.hash_bytes_total - progress.hash_bytes_done);
  }

  const auto eta = cn::seconds((int64_t)std::ceil(remaining / rate));
  check.eta = eta;
  const auto left = cn::duration_cast<cn::seconds>(_budget.requested) -
                    cn::duration_cast<cn::seconds>(progress.elapsed);
  const bool muted = phase == run_state_t::scanning && _walk_muted;
  check.exceeded = _armed && !muted &&
                   check.suggest_min_size > _budget.min_size &&
                   left > cn::seconds(0) && eta > left;
  return check;
}

void budget_estimator_t::raise(uint64_t min_size) {
  if (min_size <= _budget.min_size) {
    throw config_error_t("threshold can only be raised: " +
                         std::to_string(min_size) +
                         " <= " + std::to_string(_budget.min_size));
  }
  _budget.min_size = min_size;
  ++_budget.raise_requests;
  _armed = true;
  _resample = true;
  if (_phase == run_state_t::scanning) {
    _walk_muted = true;
  }
}

std::optional<uint64_t> tree_size_hint(const fs::path &root) {
  struct stat root_st {};
  struct stat parent_st {};
  const auto parent = root / "..";
  if (::stat(root.c_str(), &root_st) != 0 ||
      ::stat(parent.c_str(), &parent_st) != 0) {
    return std::nullopt;
  }
  // mount point: parent on another device, or "/" being its own parent
  const bool mount_point = root_st.st_dev != parent_st.st_dev ||
                           root_st.st_ino == parent_st.st_ino;
  if (!mount_point) {
    return std::nullopt;
  }
  struct statvfs vfs {};
  if (::statvfs(root.c_str(), &vfs) != 0) {
    return std::nullopt;
  }
  return (uint64_t)(vfs.f_blocks - vfs.f_bfree) * (uint64_t)vfs.f_frsize;
}

}  // namespace detail_v1

}  // namespace dupfind
