#include "dupfind/exclusion.hh"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>

#include "dupfind/log.hh"

namespace dupfind {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

std::string fold(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return str;
}

// absolute, normalized, split into case-folded segments
std::vector<std::string> segments(const fs::path &path) {
  std::error_code ec;
  auto abs_path = fs::absolute(path, ec);
  if (ec) {
    abs_path = path;
  }
  std::vector<std::string> segs;
  for (const auto &elem : abs_path.lexically_normal()) {
    auto seg = elem.string();
    if (seg.empty() || seg == ".") {
      continue;
    }
    segs.emplace_back(fold(std::move(seg)));
  }
  return segs;
}

}  // namespace

bool exclusion_set_t::add(const fs::path &prefix) {
  const auto segs = segments(prefix);
  if (segs.empty()) {
    return false;
  }
  auto *node = &_root;
  for (const auto &seg : segs) {
    auto &child = node->children[seg];
    if (!child) {
      child = std::make_unique<node_t>();
    }
    node = child.get();
  }
  if (node->terminal) {
    return false;
  }
  node->terminal = true;
  _entries.emplace_back(prefix);
  return true;
}

bool exclusion_set_t::is_excluded(const fs::path &path) const {
  if (_entries.empty()) {
    return false;
  }
  const auto *node = &_root;
  for (const auto &seg : segments(path)) {
    auto it = node->children.find(seg);
    if (it == node->children.end()) {
      return false;
    }
    node = it->second.get();
    if (node->terminal) {
      return true;
    }
  }
  return false;
}

std::vector<fs::path> default_excludes() {
  std::vector<fs::path> excludes{
      "/proc", "/sys",  "/dev",            "/run",       "/boot",
      "/lost+found", "/snap", "/var/lib/docker", "/var/cache", "/tmp/.X11-unix"};

  for (const auto *var : {"OneDrive", "OneDriveCommercial", "OneDriveConsumer"}) {
    if (const auto *val = std::getenv(var); val != nullptr && *val != '\0') {
      excludes.emplace_back(val);
    }
  }

  const auto *home_env = std::getenv("HOME");
  if (home_env == nullptr || *home_env == '\0') {
    return excludes;
  }
  const fs::path home(home_env);
  for (const auto *name : {"Dropbox", "Google Drive", "pCloudDrive", "MEGA"}) {
    excludes.emplace_back(home / name);
  }
  std::error_code ec;
  fs::directory_iterator it(home, ec);
  if (ec) {
    oss(log_to(log_lvl_t::warn))
        << "[warn] cannot list home directory: " << home << " - "
        << ec.message() << '\n';
    return excludes;
  }
  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    const auto name = fold(it->path().filename().string());
    if (name.rfind("onedrive", 0) == 0) {
      excludes.emplace_back(it->path());
    }
  }
  if (ec) {
    oss(log_to(log_lvl_t::warn))
        << "[warn] incomplete listing of home directory: " << home << " - "
        << ec.message() << '\n';
  }
  return excludes;
}

exclusion_set_t make_exclusion_set(bool no_excludes,
                                   const std::vector<fs::path> &add_excludes) {
  exclusion_set_t set;
  if (!no_excludes) {
    for (const auto &path : default_excludes()) {
      set.add(path);
    }
  }
  for (const auto &path : add_excludes) {
    set.add(path);
  }
  return set;
}

}  // namespace detail_v1

}  // namespace dupfind
