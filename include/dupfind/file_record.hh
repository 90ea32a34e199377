#pragma once

#include <cstdint>
#include <filesystem>
#include <utility>

namespace dupfind {

inline namespace detail_v1 {

class file_record_t {
  std::filesystem::path _path;
  uint64_t _size = 0;
  std::filesystem::file_time_type _mtime{};
  // discovery index within one scan
  uint64_t _seq = 0;
  bool _placeholder = false;

 public:
  template <typename Tp>
  inline file_record_t(Tp &&path, const uint64_t size,
                       const std::filesystem::file_time_type mtime,
                       const uint64_t seq, const bool placeholder = false)
      : _path(std::forward<Tp>(path)),
        _size(size),
        _mtime(mtime),
        _seq(seq),
        _placeholder(placeholder) {}

  inline file_record_t(const file_record_t &rhs) = default;
  inline file_record_t(file_record_t &&rhs) = default;
  inline file_record_t &operator=(const file_record_t &rhs) = default;
  inline file_record_t &operator=(file_record_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }
  inline std::filesystem::file_time_type mtime() const noexcept {
    return _mtime;
  }
  inline uint64_t seq() const noexcept { return _seq; }
  inline bool placeholder() const noexcept { return _placeholder; }
};

}  // namespace detail_v1

}  // namespace dupfind
