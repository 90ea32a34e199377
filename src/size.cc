#include "dupfind/size.hh"

#include <array>
#include <cstdio>
#include <limits>

#include "dupfind/error.hh"

namespace dupfind::utils {

namespace {

// fast pow of unsigned long
uint64_t pow_ul(uint64_t base, uint64_t exp) {
  uint64_t result = 1;
  while (exp != 0) {
    if (exp & 1) {
      result *= base;
    }
    exp = exp >> 1;
    base *= base;
  }
  return result;
}

bool is_num(char c) { return c >= '0' && c <= '9'; }

[[noreturn]] void invalid(const std::string &size_str) {
  throw config_error_t("invalid size string: " + size_str);
}

}  // namespace

uint64_t parse_size(const std::string &size_str) {
  uint64_t size_num = 0;
  const auto size_len = size_str.size();
  const std::array<char, 6> unit_dict({'K', 'M', 'G', 'T', 'P', 'E'});
  bool as_bit = false;
  bool as_bibyte = false;
  uint64_t scale = 0;

  if (size_len == 0 || !is_num(size_str[0])) {
    invalid(size_str);
  }
  for (std::size_t i = 0; i < size_len; i++) {
    auto c = size_str[i];
    if (is_num(c)) {
      const uint64_t digit = (uint64_t)(c - '0');
      if (size_num > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
        invalid(size_str);
      }
      size_num = size_num * 10 + digit;
      continue;
    }
    for (std::size_t j = 0; j < unit_dict.size(); j++) {
      if (c == unit_dict[j] || c == unit_dict[j] + 32) {
        scale = j + 1;
        i++;
        break;
      }
    }
    if (scale != 0 && i < size_len && size_str[i] == 'i') {
      as_bibyte = true;
      i++;
    }
    if (i < size_len) {
      c = size_str[i];
      if (c == 'b') {
        as_bit = true;
      } else if (c != 'B') {
        invalid(size_str);
      }
      i++;
    }
    if (i != size_len) {
      invalid(size_str);
    }
    break;
  }

  const auto unit = pow_ul((as_bibyte ? 1024 : 1000), scale);
  if (unit != 0 && size_num > std::numeric_limits<uint64_t>::max() / unit) {
    invalid(size_str);
  }
  return size_num * unit / (as_bit ? 8 : 1);
}

std::string format_size(uint64_t size) {
  static constexpr std::array<const char *, 5> units{"B", "KiB", "MiB", "GiB",
                                                     "TiB"};
  if (size < 1024) {
    return std::to_string(size) + " B";
  }
  auto x = (double)size;
  std::size_t i = 0;
  while (x >= 1024.0 && i < units.size() - 1) {
    x /= 1024.0;
    ++i;
  }
  std::array<char, 32> buf{};
  std::snprintf(buf.data(), buf.size(), "%.1f %s", x, units[i]);
  return buf.data();
}

}  // namespace dupfind::utils
