#include "dupfind/name_key.hh"

#include <cctype>
#include <regex>

namespace dupfind {

inline namespace detail_v1 {

namespace {

// leading date, optional time, trailing separators
const std::regex &timestamp_regex() {
  static const std::regex re(
      R"(^(?:\d{8}|\d{6}|\d{4}[-_.]\d{2}[-_.]\d{2}|\d{2}[-_.]\d{2}[-_.]\d{2}))"
      R"((?:[-_ ]?(?:\d{6}|\d{4})(?!\d)|(?!\d))[-_. ]*)",
      std::regex::ECMAScript | std::regex::optimize);
  return re;
}

bool is_sep(unsigned char c) noexcept {
  return c == '-' || c == '_' || c == '.' || std::isspace(c) != 0;
}

// separator runs to one space, trimmed, ascii lower-case
std::string fold(std::string_view str) {
  std::string out;
  out.reserve(str.size());
  bool pending_sep = false;
  for (const unsigned char c : str) {
    if (is_sep(c)) {
      pending_sep = true;
      continue;
    }
    if (pending_sep && !out.empty()) {
      out += ' ';
    }
    pending_sep = false;
    out += static_cast<char>(std::tolower(c));
  }
  return out;
}

}  // namespace

std::size_t timestamp_prefix(std::string_view name) {
  std::cmatch match;
  if (!std::regex_search(name.data(), name.data() + name.size(), match,
                         timestamp_regex())) {
    return 0;
  }
  return static_cast<std::size_t>(match.length(0));
}

std::string normalize_name(std::string_view file_name, ext_mode_t mode) {
  auto candidate = file_name;
  if (mode == ext_mode_t::ignore) {
    // a leading dot marks a hidden file, not an extension
    const auto dot = candidate.rfind('.');
    if (dot != std::string_view::npos && dot != 0) {
      candidate = candidate.substr(0, dot);
    }
  }
  auto key = fold(candidate.substr(timestamp_prefix(candidate)));
  if (key.empty()) {
    // nothing but a timestamp, compare on the whole name
    key = fold(candidate);
  }
  return key;
}

}  // namespace detail_v1

}  // namespace dupfind
