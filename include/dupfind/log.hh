#pragma once

#include <iostream>
#include <mutex>
#include <version>

#if __cpp_lib_syncbuf >= 201803L
#include <syncstream>
#endif

namespace dupfind {

inline namespace detail_v1 {

#if __cpp_lib_syncbuf >= 201803L

// osyncstream is provided
using oss = std::osyncstream;

#else

// self-implemented osyncstream
class oss {
 private:
  inline static std::mutex _mtx;
  std::ostream &_os;

 public:
  oss() = delete;
  inline oss(std::ostream &os) : _os(os) { _mtx.lock(); }
  inline ~oss() {
    _os.flush();
    _mtx.unlock();
  }

  oss(const oss &) = delete;
  oss(oss &&) = delete;
  oss &operator=(const oss &) = delete;
  oss &operator=(oss &&) = delete;

  template <typename Tp>
  inline oss &operator<<(const Tp &val) {
    _os << val;
    return *this;
  }
  inline operator std::ostream &() noexcept { return _os; }
};

#endif

enum class log_lvl_t { verbose, log, warn, err };

/**
 * @brief redirect diagnostics, the stream must outlive every scan using it
 */
void set_log_stream(std::ostream &os) noexcept;
void set_log_level(log_lvl_t lvl) noexcept;

std::ostream &log_stream() noexcept;
bool log_enabled(log_lvl_t lvl) noexcept;

/**
 * @brief sink for one message of level lvl: the log stream, or a stream
 * discarding everything when lvl is below the active level.
 * usage: oss(log_to(log_lvl_t::warn)) << "[warn] ..." << '\n';
 */
std::ostream &log_to(log_lvl_t lvl) noexcept;

}  // namespace detail_v1

}  // namespace dupfind
