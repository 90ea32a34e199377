#pragma once

#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace dupfind {

inline namespace detail_v1 {

/**
 * @brief pause point for hashing workers, closed while the caller decides
 * on an exceeded budget
 */
class gate_t {
  std::mutex _mtx;
  std::condition_variable_any _cv;
  bool _open = true;

 public:
  gate_t() = default;
  gate_t(const gate_t &) = delete;
  gate_t &operator=(const gate_t &) = delete;

  inline void close() {
    std::lock_guard lk(_mtx);
    _open = false;
  }

  inline void open() {
    {
      std::lock_guard lk(_mtx);
      _open = true;
    }
    _cv.notify_all();
  }

  /**
   * @brief block while closed
   * @return false if a stop was requested instead
   */
  inline bool wait(const std::stop_token &st) {
    std::unique_lock lk(_mtx);
    return _cv.wait(lk, st, [this] { return _open; });
  }
};

}  // namespace detail_v1

}  // namespace dupfind
