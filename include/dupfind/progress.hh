#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

namespace dupfind {

inline namespace detail_v1 {

enum class run_state_t { scanning, hashing, needs_tuning, done, cancelled };

std::string_view to_string(run_state_t state) noexcept;

// counters of one scan invocation, always copied out as a whole
struct progress_t {
  run_state_t state = run_state_t::scanning;

  // walk
  uint64_t files_visited = 0;  // regular files seen, below threshold included
  uint64_t files_skipped = 0;  // excluded, placeholder, unreadable, too small
  uint64_t files_kept = 0;     // records handed to a bucketer
  uint64_t bytes_visited = 0;
  uint64_t dirs_visited = 0;
  uint64_t dirs_pending = 0;

  // hashing, size path only
  uint64_t hash_total = 0;
  uint64_t hash_done = 0;
  uint64_t hash_bytes_total = 0;
  uint64_t hash_bytes_done = 0;  // settled: digested, unique, skipped
  uint64_t hash_bytes_read = 0;  // actually read, leading blocks included

  std::chrono::milliseconds elapsed{0};
  // time spent in the current state, the estimator rates against it
  std::chrono::milliseconds phase_elapsed{0};

  uint64_t min_size = 0;
  std::chrono::seconds budget{0};
  std::optional<std::chrono::seconds> eta;
  std::optional<uint64_t> suggest_min_size;
};

/**
 * @brief single owner of the live progress_t, readers get a copy taken under
 * the same lock writers use, so a snapshot is never half updated
 */
class progress_board_t {
  mutable std::mutex _mtx;
  progress_t _snap;

 public:
  progress_board_t() = default;
  progress_board_t(const progress_board_t &) = delete;
  progress_board_t &operator=(const progress_board_t &) = delete;

  inline void publish(const progress_t &snap) {
    std::lock_guard lk(_mtx);
    _snap = snap;
  }

  template <typename Fn>
  inline void update(Fn &&fn) {
    std::lock_guard lk(_mtx);
    std::forward<Fn>(fn)(_snap);
  }

  inline progress_t snapshot() const {
    std::lock_guard lk(_mtx);
    return _snap;
  }
};

}  // namespace detail_v1

}  // namespace dupfind
