#include "dupfind/log.hh"

#include <atomic>
#include <ostream>

namespace dupfind {

inline namespace detail_v1 {

namespace {

std::atomic<std::ostream *> log_os{&std::cerr};
std::atomic<log_lvl_t> log_lvl{log_lvl_t::log};

// no stream buffer, every write is dropped
std::ostream &null_stream() noexcept {
  static std::ostream os(nullptr);
  return os;
}

}  // namespace

void set_log_stream(std::ostream &os) noexcept { log_os.store(&os); }

void set_log_level(log_lvl_t lvl) noexcept { log_lvl.store(lvl); }

std::ostream &log_stream() noexcept { return *log_os.load(); }

bool log_enabled(log_lvl_t lvl) noexcept { return lvl >= log_lvl.load(); }

std::ostream &log_to(log_lvl_t lvl) noexcept {
  return log_enabled(lvl) ? log_stream() : null_stream();
}

}  // namespace detail_v1

}  // namespace dupfind
