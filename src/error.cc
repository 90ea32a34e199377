#include "dupfind/error.hh"

namespace dupfind {

inline namespace detail_v1 {

io_fault_t classify(const std::error_code &ec) noexcept {
  if (ec == std::errc::permission_denied ||
      ec == std::errc::operation_not_permitted) {
    return io_fault_t::permission_denied;
  }
  return io_fault_t::transient;
}

}  // namespace detail_v1

}  // namespace dupfind
