#pragma once

#include <openssl/evp.h>
#include <xxhash.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

namespace dupfind {

inline namespace detail_v1 {

// RAII wrapper for xxhash library.
class prefix_hasher_t {
  XXH3_state_t *_state;

 public:
  prefix_hasher_t();
  ~prefix_hasher_t() noexcept;

  prefix_hasher_t(const prefix_hasher_t &rhs) = delete;
  prefix_hasher_t(prefix_hasher_t &&rhs) = delete;
  prefix_hasher_t &operator=(const prefix_hasher_t &rhs) = delete;
  prefix_hasher_t &operator=(prefix_hasher_t &&rhs) = delete;

  void reset();
  void update(const char *data, uint64_t size);
  XXH128_hash_t digest() noexcept { return XXH3_128bits_digest(_state); }
};

// RAII wrapper for an EVP digest context.
class digest_hasher_t {
  EVP_MD_CTX *_ctx;
  const EVP_MD *_md;

 public:
  explicit digest_hasher_t(const EVP_MD *md);
  ~digest_hasher_t() noexcept;

  digest_hasher_t(const digest_hasher_t &rhs) = delete;
  digest_hasher_t(digest_hasher_t &&rhs) = delete;
  digest_hasher_t &operator=(const digest_hasher_t &rhs) = delete;
  digest_hasher_t &operator=(digest_hasher_t &&rhs) = delete;

  void reset();
  void update(const char *data, uint64_t size);
  // lower-case hex
  std::string digest();
};

/**
 * @brief look up a digest supported by libcrypto
 * @throws config_error_t if the name is unknown
 */
const EVP_MD *digest_by_name(const std::string &name);

/**
 * @brief xxh3-128 of the first len bytes
 * @throws io_error_t if the file cannot be opened or is shorter than len
 */
XXH128_hash_t prefix_hash(const std::filesystem::path &path, uint64_t len);

/**
 * @brief digest of the whole file, expected to be size bytes long
 *
 * @return hex digest, or nullopt when a stop was requested mid-read
 * @throws io_error_t on open failure, read failure or size mismatch
 */
std::optional<std::string> file_digest(const std::filesystem::path &path,
                                       uint64_t size, const EVP_MD *md,
                                       const std::stop_token &st = {});

}  // namespace detail_v1

}  // namespace dupfind
