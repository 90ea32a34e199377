#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace dupfind {

inline namespace detail_v1 {

class error_t : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// rejected options, raised before any scanning starts
class config_error_t : public error_t {
 public:
  using error_t::error_t;
};

enum class io_fault_t {
  permission_denied,  // skip entry, continue
  transient           // vanished, locked or short read, skip entry, continue
};

io_fault_t classify(const std::error_code &ec) noexcept;

class io_error_t : public error_t {
  std::filesystem::path _path;
  std::error_code _ec;

 public:
  io_error_t(std::filesystem::path path, std::error_code ec)
      : error_t(path.string() + " - " + ec.message()),
        _path(std::move(path)),
        _ec(ec) {}

  const std::filesystem::path &path() const noexcept { return _path; }
  const std::error_code &code() const noexcept { return _ec; }
  io_fault_t fault() const noexcept { return classify(_ec); }
};

}  // namespace detail_v1

}  // namespace dupfind
