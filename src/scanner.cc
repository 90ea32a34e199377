#include "dupfind/scanner.hh"

#include <string_view>
#include <system_error>

#include "dupfind/error.hh"
#include "dupfind/log.hh"
#include "dupfind/placeholder.hh"

namespace dupfind {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

std::string_view fault_name(const std::error_code &ec) noexcept {
  return classify(ec) == io_fault_t::permission_denied ? "permission denied"
                                                       : "io error";
}

}  // namespace

scanner_t::scanner_t(const fs::path &root, const exclusion_set_t &excludes,
                     uint64_t min_size, bool include_cloud)
    : _excludes(excludes), _min_size(min_size), _include_cloud(include_cloud) {
  std::error_code ec;
  auto abs_root = fs::absolute(root, ec);
  if (ec) {
    oss(log_to(log_lvl_t::warn))
        << "[warn] skip root: " << root << " - " << ec.message() << '\n';
    return;
  }
  abs_root = abs_root.lexically_normal();
  if (_excludes.is_excluded(abs_root)) {
    oss(log_to(log_lvl_t::warn))
        << "[warn] root is excluded: " << abs_root << '\n';
    return;
  }
  _pending.emplace_back(std::move(abs_root));
}

void scanner_t::open_next_dir() {
  _cur_dir = std::move(_pending.back());
  _pending.pop_back();
  std::error_code ec;
  _cur_it = fs::directory_iterator(_cur_dir, ec);
  if (ec) {
    // error open directory, skip
    oss(log_to(log_lvl_t::warn))
        << "[warn] skip directory: " << _cur_dir << " - " << fault_name(ec)
        << ": " << ec.message() << '\n';
    return;
  }
  ++_dirs_visited;
  _in_dir = true;
}

std::optional<file_record_t> scanner_t::next(const std::stop_token &st) {
  while (true) {
    if (st.stop_requested()) {
      _pending.clear();
      _in_dir = false;
      return std::nullopt;
    }
    if (!_in_dir) {
      if (_pending.empty()) {
        return std::nullopt;
      }
      open_next_dir();
      continue;
    }
    if (_cur_it == fs::directory_iterator()) {
      _in_dir = false;
      continue;
    }

    const fs::directory_entry entry = *_cur_it;
    std::error_code ec;
    _cur_it.increment(ec);
    if (ec) {
      // error iterate directory, keep what was listed so far
      oss(log_to(log_lvl_t::warn))
          << "[warn] incomplete directory: " << _cur_dir << " - "
          << ec.message() << '\n';
      _cur_it = fs::directory_iterator();
    }
    if (auto record = visit(entry)) {
      return record;
    }
  }
}

std::optional<file_record_t> scanner_t::visit(const fs::directory_entry &entry) {
  const auto &path = entry.path();
  std::error_code ec;
  const auto status = entry.symlink_status(ec);
  if (ec) {
    oss(log_to(log_lvl_t::warn))
        << "[warn] skip entry: " << path << " - " << ec.message() << '\n';
    ++_files_skipped;
    return std::nullopt;
  }

  if (fs::is_directory(status)) {
    if (_excludes.is_excluded(path)) {
      oss(log_to(log_lvl_t::verbose)) << "[log] exclude: " << path << '\n';
    } else {
      _pending.emplace_back(path);
    }
    return std::nullopt;
  }

  if (_excludes.is_excluded(path)) {
    oss(log_to(log_lvl_t::verbose)) << "[log] exclude: " << path << '\n';
    ++_files_skipped;
    return std::nullopt;
  }
  if (fs::is_symlink(status)) {
    oss(log_to(log_lvl_t::verbose)) << "[log] skip symlink: " << path << '\n';
    ++_files_skipped;
    return std::nullopt;
  }
  if (!fs::is_regular_file(status)) {
    oss(log_to(log_lvl_t::verbose))
        << "[log] skip unsupport file: " << path << '\n';
    ++_files_skipped;
    return std::nullopt;
  }

  ++_files_visited;
  const auto size = entry.file_size(ec);
  if (ec) {
    oss(log_to(log_lvl_t::warn))
        << "[warn] skip file: " << path << " - " << fault_name(ec) << ": "
        << ec.message() << '\n';
    ++_files_skipped;
    return std::nullopt;
  }
  _bytes_visited += size;
  if (size == 0 || size < _min_size) {
    ++_files_skipped;
    return std::nullopt;
  }

  const bool placeholder = is_cloud_placeholder(path, ec);
  if (ec) {
    oss(log_to(log_lvl_t::warn))
        << "[warn] skip file: " << path << " - " << fault_name(ec) << ": "
        << ec.message() << '\n';
    ++_files_skipped;
    return std::nullopt;
  }
  if (placeholder && !_include_cloud) {
    oss(log_to(log_lvl_t::verbose))
        << "[log] skip cloud placeholder: " << path << '\n';
    ++_files_skipped;
    return std::nullopt;
  }

  const auto mtime = entry.last_write_time(ec);
  if (ec) {
    oss(log_to(log_lvl_t::warn))
        << "[warn] skip file: " << path << " - " << fault_name(ec) << ": "
        << ec.message() << '\n';
    ++_files_skipped;
    return std::nullopt;
  }
  return file_record_t(path, size, mtime, _seq++, placeholder);
}

void scanner_t::fill(progress_t &progress) const noexcept {
  progress.files_visited = _files_visited;
  progress.files_skipped = _files_skipped;
  progress.files_kept = _seq;
  progress.bytes_visited = _bytes_visited;
  progress.dirs_visited = _dirs_visited;
  progress.dirs_pending = _pending.size() + (_in_dir ? 1U : 0U);
  progress.min_size = _min_size;
}

}  // namespace detail_v1

}  // namespace dupfind
