#include "dupfind/progress.hh"

namespace dupfind {

inline namespace detail_v1 {

std::string_view to_string(run_state_t state) noexcept {
  switch (state) {
    case run_state_t::scanning:
      return "scanning";
    case run_state_t::hashing:
      return "hashing";
    case run_state_t::needs_tuning:
      return "needs_tuning";
    case run_state_t::done:
      return "done";
    case run_state_t::cancelled:
      return "cancelled";
  }
  return "unknown";
}

}  // namespace detail_v1

}  // namespace dupfind
