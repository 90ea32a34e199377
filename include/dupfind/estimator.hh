#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>

#include "dupfind/progress.hh"

namespace dupfind {

inline namespace detail_v1 {

// soft wall-clock budget of one run
struct time_budget_t {
  std::chrono::minutes requested{0};
  uint64_t min_size = 0;
  uint32_t raise_requests = 0;
};

// result of one progress observation
struct budget_check_t {
  std::optional<std::chrono::seconds> eta;
  bool exceeded = false;
  uint64_t suggest_min_size = 0;
};

/**
 * @brief projects the remaining time of the running phase from a progress
 * snapshot and signals when it no longer fits the budget. it never stops
 * anything, the caller decides between continuing and raising the threshold.
 *
 * scanning rate is bytes visited per second of walk; the tree size is
 * projected from bytes per visited directory times pending directories and
 * never shrinks. hashing rate is bytes actually read per second of hashing,
 * the remaining work is the bytes not yet settled.
 *
 * the rate is sampled from the start of the phase, or from the first
 * observation after a raise. the walk visits every entry whatever the
 * threshold, so a raise while scanning silences the signal until hashing.
 */
class budget_estimator_t {
  time_budget_t _budget;
  uint64_t _est_total = 0;
  bool _armed = true;

  // phase of the last observation and start of its rate sample
  run_state_t _phase = run_state_t::scanning;
  std::chrono::milliseconds _sample_at{0};
  uint64_t _sample_bytes = 0;
  bool _resample = false;
  bool _walk_muted = false;

 public:
  /**
   * @param tree_size_hint initial guess of the bytes under the root, e.g. the
   * used space of the volume when the root is a mount point
   */
  budget_estimator_t(std::chrono::minutes budget, uint64_t min_size,
                     std::optional<uint64_t> tree_size_hint = std::nullopt);

  budget_check_t observe(const progress_t &progress);

  /**
   * @brief the caller chose to run over budget, no further signal for this
   * run unless the threshold is raised
   */
  inline void acknowledge() noexcept { _armed = false; }

  /**
   * @brief raise the threshold, re-arm the signal and restart the rate sample
   * @throws config_error_t if min_size does not exceed the current threshold
   */
  void raise(uint64_t min_size);

  inline const time_budget_t &budget() const noexcept { return _budget; }
  inline uint64_t estimated_total_bytes() const noexcept { return _est_total; }
  inline bool armed() const noexcept { return _armed; }
};

/**
 * @brief next threshold to offer: twice the current one, at least 50MiB,
 * saturating at the largest size
 */
uint64_t suggest_min_size(uint64_t min_size) noexcept;

/**
 * @brief used bytes of the volume when root is its mount point
 */
std::optional<uint64_t> tree_size_hint(const std::filesystem::path &root);

}  // namespace detail_v1

}  // namespace dupfind
