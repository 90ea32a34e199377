#include "dupfind/size_finder.hh"

#include <algorithm>
#include <iterator>
#include <map>
#include <string>
#include <utility>

#include "dupfind/config.hh"
#include "dupfind/digest.hh"
#include "dupfind/error.hh"
#include "dupfind/log.hh"

namespace dupfind {

inline namespace detail_v1 {

void size_bucketer_t::add(file_record_t record) {
  const auto size = record.size();
  auto [it, inserted] = _index.try_emplace(size, _buckets.size());
  if (inserted) {
    _buckets.push_back(size_bucket_t{size, {}});
  }
  _buckets[it->second].files.emplace_back(std::move(record));
  ++_file_cnt;
}

void size_bucketer_t::drop_below(uint64_t min_size) {
  std::vector<size_bucket_t> kept;
  kept.reserve(_buckets.size());
  _index.clear();
  _file_cnt = 0;
  for (auto &bucket : _buckets) {
    if (bucket.size < min_size) {
      continue;
    }
    _index.emplace(bucket.size, kept.size());
    _file_cnt += bucket.files.size();
    kept.emplace_back(std::move(bucket));
  }
  _buckets = std::move(kept);
}

std::vector<size_bucket_t> size_bucketer_t::take_candidates() {
  std::vector<size_bucket_t> candidates;
  for (auto &bucket : _buckets) {
    // a single file of its size can not have a duplicate, never hashed
    if (bucket.files.size() > 1) {
      candidates.emplace_back(std::move(bucket));
    }
  }
  _buckets.clear();
  _index.clear();
  _file_cnt = 0;
  return candidates;
}

digest_verifier_t::digest_verifier_t(const EVP_MD *md,
                                     const std::atomic<uint64_t> &min_size,
                                     gate_t &gate, progress_board_t &board)
    : _md(md), _min_size(min_size), _gate(gate), _board(board) {}

void digest_verifier_t::expect(const size_bucket_t &bucket) {
  std::lock_guard lk(_ledger_mtx);
  _unsettled.try_emplace(bucket.size, bucket.files.size());
}

void digest_verifier_t::settle_below(uint64_t min_size) {
  uint64_t files = 0;
  uint64_t bytes = 0;
  {
    std::lock_guard lk(_ledger_mtx);
    for (auto it = _unsettled.begin();
         it != _unsettled.end() && it->first < min_size; ++it) {
      files += it->second;
      bytes += it->second * it->first;
      it->second = 0;
    }
  }
  if (files == 0) {
    return;
  }
  _board.update([files, bytes](progress_t &progress) {
    progress.hash_done += files;
    progress.hash_bytes_done += bytes;
  });
}

void digest_verifier_t::mark_done(uint64_t size, uint64_t files) {
  {
    std::lock_guard lk(_ledger_mtx);
    auto it = _unsettled.find(size);
    if (it == _unsettled.end()) {
      return;
    }
    // already settled by a raise
    files = std::min(files, it->second);
    it->second -= files;
  }
  if (files == 0) {
    return;
  }
  _board.update([files, size](progress_t &progress) {
    progress.hash_done += files;
    progress.hash_bytes_done += files * size;
  });
}

void digest_verifier_t::mark_read(uint64_t bytes) {
  _board.update([bytes](progress_t &progress) {
    progress.hash_bytes_read += bytes;
  });
}

void digest_verifier_t::verify(size_bucket_t bucket, const std::stop_token &st) {
  const auto size = bucket.size;
  uint64_t remain = bucket.files.size();
  expect(bucket);

  // false when the bucket must be abandoned
  auto proceed = [&]() {
    if (st.stop_requested() || !_gate.wait(st) || st.stop_requested()) {
      return false;
    }
    if (size < _min_size.load()) {
      // threshold raised past this bucket
      mark_done(size, remain);
      return false;
    }
    return true;
  };
  auto skip_unreadable = [&](const io_error_t &e) {
    ++_stats.unreadable;
    oss(log_to(log_lvl_t::warn))
        << "[warn] skip unreadable: " << e.path() << " - "
        << (e.fault() == io_fault_t::permission_denied ? "permission denied"
                                                       : "io error")
        << ": " << e.code().message() << '\n';
    mark_done(size, 1);
    --remain;
  };

  // split by leading block
  std::map<std::pair<uint64_t, uint64_t>, std::vector<file_record_t>> by_prefix;
  const auto prefix_len = std::min<uint64_t>(size, prefix_blk_sz);
  for (auto &file : bucket.files) {
    if (!proceed()) {
      return;
    }
    try {
      const auto hash = prefix_hash(file.path(), prefix_len);
      ++_stats.prefix_hashed;
      mark_read(prefix_len);
      by_prefix[{hash.high64, hash.low64}].emplace_back(std::move(file));
    } catch (const io_error_t &e) {
      skip_unreadable(e);
    }
  }

  // full digest of the members sharing a leading block
  std::map<std::string, std::vector<file_record_t>> by_digest;
  for (auto &[prefix, files] : by_prefix) {
    if (files.size() < 2) {
      mark_done(size, files.size());
      remain -= files.size();
      continue;
    }
    for (auto &file : files) {
      if (!proceed()) {
        return;
      }
      try {
        auto digest = file_digest(file.path(), size, _md, st);
        if (!digest) {
          return;
        }
        ++_stats.digested;
        mark_read(size);
        by_digest[*digest].emplace_back(std::move(file));
        mark_done(size, 1);
        --remain;
      } catch (const io_error_t &e) {
        skip_unreadable(e);
      }
    }
  }

  std::vector<duplicate_group_t> groups;
  for (auto &[digest, files] : by_digest) {
    if (files.size() > 1) {
      groups.emplace_back(group_kind_t::digest, digest, std::move(files));
    }
  }
  if (!groups.empty()) {
    std::lock_guard lk(_mtx);
    _groups.insert(_groups.end(), std::make_move_iterator(groups.begin()),
                   std::make_move_iterator(groups.end()));
  }
}

std::vector<duplicate_group_t> digest_verifier_t::take_groups() {
  std::lock_guard lk(_mtx);
  return std::exchange(_groups, {});
}

}  // namespace detail_v1

}  // namespace dupfind
