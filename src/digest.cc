#include "dupfind/digest.hh"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>

#include "dupfind/config.hh"
#include "dupfind/error.hh"

namespace dupfind {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

// per worker read buffer
char *read_buf() {
  thread_local std::unique_ptr<char[]> buf(new char[buf_sz]);
  return buf.get();
}

std::error_code last_error() noexcept {
  if (errno != 0) {
    return {errno, std::generic_category()};
  }
  return std::make_error_code(std::errc::io_error);
}

std::ifstream open_file(const fs::path &path) {
  errno = 0;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    throw io_error_t(path, last_error());
  }
  return ifs;
}

}  // namespace

prefix_hasher_t::prefix_hasher_t() {
  _state = XXH3_createState();
  if (_state == nullptr) {
    throw std::runtime_error("XXH3_createState failed");
  }
  reset();
}

prefix_hasher_t::~prefix_hasher_t() noexcept {
  if (_state != nullptr) {
    XXH3_freeState(_state);
  }
}

void prefix_hasher_t::reset() {
  if (XXH3_128bits_reset_withSeed(_state, hash_seed) == XXH_ERROR) {
    throw std::runtime_error("XXH3_128bits_reset_withSeed failed");
  }
}

void prefix_hasher_t::update(const char *data, const uint64_t size) {
  if (XXH3_128bits_update(_state, data, size) == XXH_ERROR) {
    throw std::runtime_error("XXH3_128bits_update failed");
  }
}

digest_hasher_t::digest_hasher_t(const EVP_MD *md) : _md(md) {
  _ctx = EVP_MD_CTX_new();
  if (_ctx == nullptr) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  reset();
}

digest_hasher_t::~digest_hasher_t() noexcept {
  if (_ctx != nullptr) {
    EVP_MD_CTX_free(_ctx);
  }
}

void digest_hasher_t::reset() {
  if (EVP_DigestInit_ex(_ctx, _md, nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

void digest_hasher_t::update(const char *data, const uint64_t size) {
  if (EVP_DigestUpdate(_ctx, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

std::string digest_hasher_t::digest() {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_DigestFinal_ex(_ctx, md, &md_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  static constexpr char hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(md_len * 2U);
  for (auto i = 0U; i < md_len; ++i) {
    out += hex[md[i] >> 4U];
    out += hex[md[i] & 0xfU];
  }
  return out;
}

const EVP_MD *digest_by_name(const std::string &name) {
  const EVP_MD *md = EVP_get_digestbyname(name.c_str());
  if (md == nullptr) {
    throw config_error_t("invalid digest algorithm: " + name);
  }
  return md;
}

XXH128_hash_t prefix_hash(const fs::path &path, const uint64_t len) {
  auto ifs = open_file(path);
  auto *buf = read_buf();
  prefix_hasher_t hasher;
  auto remain = len;
  while (remain > 0) {
    const auto read_sz = std::min<uint64_t>(buf_sz, remain);
    const auto read_len = ifs.read(buf, (std::streamsize)read_sz).gcount();
    if (read_sz != (uint64_t)read_len) {
      throw io_error_t(path, std::make_error_code(std::errc::io_error));
    }
    hasher.update(buf, read_sz);
    remain -= read_sz;
  }
  return hasher.digest();
}

std::optional<std::string> file_digest(const fs::path &path,
                                       const uint64_t size, const EVP_MD *md,
                                       const std::stop_token &st) {
  auto ifs = open_file(path);
  auto *buf = read_buf();
  digest_hasher_t hasher(md);
  auto remain = size;
  while (remain > 0) {
    if (st.stop_requested()) {
      return std::nullopt;
    }
    const auto read_sz = std::min<uint64_t>(buf_sz, remain);
    const auto read_len = ifs.read(buf, (std::streamsize)read_sz).gcount();
    if (read_sz != (uint64_t)read_len) {
      // shrunk or failed mid-read
      throw io_error_t(path, std::make_error_code(std::errc::io_error));
    }
    hasher.update(buf, read_sz);
    remain -= read_sz;
  }
  if (ifs.peek() != std::ifstream::traits_type::eof()) {
    // grew since it was listed
    throw io_error_t(path, std::make_error_code(std::errc::io_error));
  }
  return hasher.digest();
}

}  // namespace detail_v1

}  // namespace dupfind
