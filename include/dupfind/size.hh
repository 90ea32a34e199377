#pragma once

#include <cstdint>
#include <string>

namespace dupfind::utils {

/**
 * @brief Parse a size string such as "1048576", "10MiB", "50MB" or "8Kb".
 * @throws config_error_t if not a valid size string.
 */
uint64_t parse_size(const std::string &size_str);

/**
 * @brief human readable size, "512 B", "10.0 MiB"
 */
std::string format_size(uint64_t size);

}  // namespace dupfind::utils
