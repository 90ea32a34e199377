#pragma once

#include <string>
#include <string_view>

namespace dupfind {

inline namespace detail_v1 {

enum class ext_mode_t {
  ignore,  // "report.pdf" and "report.docx" share a key
  keep     // extension is part of the key
};

/**
 * @brief length of a leading timestamp plus the separators after it, 0 if the
 * name does not start with one. dates are not validated, only their shape:
 * YYYYMMDD, YYMMDD, YYYY-MM-DD or YY-MM-DD (separator '-', '_' or '.'),
 * optionally followed by HHMM or HHMMSS, with or without a '-', '_' or ' '
 * separator.
 */
std::size_t timestamp_prefix(std::string_view name);

/**
 * @brief comparison key of a file name (no directory part): extension
 * removed unless kept, leading timestamp stripped, '-', '_', '.' and
 * whitespace runs folded into one space, trimmed, ascii lower-cased.
 * when stripping the timestamp leaves nothing, the whole name is used.
 */
std::string normalize_name(std::string_view file_name, ext_mode_t mode);

}  // namespace detail_v1

}  // namespace dupfind
