#pragma once

#include <filesystem>
#include <system_error>

namespace dupfind {

inline namespace detail_v1 {

/**
 * @brief detects sync-client stubs whose content is not stored locally,
 * reading such a file triggers a download. only inspects metadata, the file
 * is never opened.
 *
 * @param path file to inspect, symlinks are not followed
 * @param[out] ec set when the metadata cannot be read
 * @return true if the file has a positive size but no allocated blocks
 */
bool is_cloud_placeholder(const std::filesystem::path &path,
                          std::error_code &ec) noexcept;

}  // namespace detail_v1

}  // namespace dupfind
