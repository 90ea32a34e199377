#include "dupfind/result.hh"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace dupfind {

inline namespace detail_v1 {

namespace {

bool by_seq(const file_record_t &lhs, const file_record_t &rhs) {
  return lhs.seq() < rhs.seq();
}

}  // namespace

duplicate_group_t::duplicate_group_t(group_kind_t kind, std::string key,
                                     std::vector<file_record_t> files)
    : _kind(kind), _key(std::move(key)), _files(std::move(files)) {
  if (_files.size() < 2) {
    throw std::invalid_argument("duplicate group needs two members: " + _key);
  }
  std::sort(_files.begin(), _files.end(), by_seq);
  _wasted = wasted_bytes(_kind, _files);
}

uint64_t duplicate_group_t::size() const noexcept {
  uint64_t largest = 0;
  for (const auto &file : _files) {
    largest = std::max(largest, file.size());
  }
  return largest;
}

uint64_t wasted_bytes(group_kind_t kind, const std::vector<file_record_t> &files) {
  if (files.size() < 2) {
    return 0;
  }
  if (kind == group_kind_t::digest) {
    return files.front().size() * (files.size() - 1);
  }
  uint64_t total = 0;
  uint64_t largest = 0;
  for (const auto &file : files) {
    total += file.size();
    largest = std::max(largest, file.size());
  }
  return total - largest;
}

std::vector<duplicate_group_t> rank_groups(std::vector<duplicate_group_t> groups) {
  std::sort(groups.begin(), groups.end(),
            [](const duplicate_group_t &lhs, const duplicate_group_t &rhs) {
              if (lhs.wasted() != rhs.wasted()) {
                return lhs.wasted() > rhs.wasted();
              }
              if (lhs.files().size() != rhs.files().size()) {
                return lhs.files().size() > rhs.files().size();
              }
              return lhs.first_seq() < rhs.first_seq();
            });
  return groups;
}

void result_aggregator_t::add(duplicate_group_t group) {
  if (group.files().size() >= 2) {
    _groups.emplace_back(std::move(group));
  }
}

void result_aggregator_t::add(std::vector<duplicate_group_t> groups) {
  for (auto &group : groups) {
    add(std::move(group));
  }
}

void result_aggregator_t::drop_below(uint64_t min_size) {
  std::vector<duplicate_group_t> kept;
  kept.reserve(_groups.size());
  for (auto &group : _groups) {
    std::vector<file_record_t> files;
    std::copy_if(group.files().begin(), group.files().end(),
                 std::back_inserter(files),
                 [min_size](const auto &file) { return file.size() >= min_size; });
    if (files.size() == group.files().size()) {
      kept.emplace_back(std::move(group));
    } else if (files.size() >= 2) {
      kept.emplace_back(group.kind(), group.key(), std::move(files));
    }
  }
  _groups = std::move(kept);
}

scan_report_t result_aggregator_t::finish(const progress_t &progress,
                                          bool complete) {
  scan_report_t report;
  report.groups = rank_groups(std::move(_groups));
  _groups.clear();
  for (const auto &group : report.groups) {
    report.total_wasted += group.wasted();
  }
  report.progress = progress;
  report.complete = complete;
  return report;
}

}  // namespace detail_v1

}  // namespace dupfind
