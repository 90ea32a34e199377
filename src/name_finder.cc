#include "dupfind/name_finder.hh"

#include <algorithm>

namespace dupfind {

inline namespace detail_v1 {

void name_bucketer_t::add(file_record_t record) {
  auto key = normalize_name(record.path().filename().string(), _mode);
  if (key.empty()) {
    return;
  }
  const auto size = _require_equal_size ? record.size() : 0;
  _buckets[{std::move(key), size}].emplace_back(std::move(record));
  ++_file_cnt;
}

void name_bucketer_t::drop_below(uint64_t min_size) {
  _file_cnt = 0;
  for (auto it = _buckets.begin(); it != _buckets.end();) {
    auto &files = it->second;
    files.erase(std::remove_if(files.begin(), files.end(),
                               [min_size](const file_record_t &file) {
                                 return file.size() < min_size;
                               }),
                files.end());
    if (files.empty()) {
      it = _buckets.erase(it);
    } else {
      _file_cnt += files.size();
      ++it;
    }
  }
}

std::vector<duplicate_group_t> name_bucketer_t::take_groups() {
  std::vector<duplicate_group_t> groups;
  for (auto &[key, files] : _buckets) {
    if (files.size() > 1) {
      groups.emplace_back(group_kind_t::name, key.first, std::move(files));
    }
  }
  _buckets.clear();
  _file_cnt = 0;
  return groups;
}

}  // namespace detail_v1

}  // namespace dupfind
