#include "dupfind/finder.hh"

#include <algorithm>
#include <exception>
#include <utility>

#include "dupfind/digest.hh"
#include "dupfind/error.hh"
#include "dupfind/log.hh"
#include "dupfind/size.hh"

#include <boost/asio/post.hpp>

namespace dupfind {

inline namespace detail_v1 {

namespace cn = std::chrono;

namespace {

options_t validated(options_t opts) {
  opts.validate();
  return opts;
}

}  // namespace

scan_session_t::scan_session_t(options_t opts, clock_fn_t clock)
    : _opts(validated(std::move(opts))),
      _clock(std::move(clock)),
      _md(_opts.mode == find_mode_t::size ? digest_by_name(_opts.digest_name)
                                          : nullptr),
      _excludes(make_exclusion_set(_opts.no_excludes, _opts.add_excludes)),
      _estimator(cn::minutes(_opts.time_budget_min), _opts.min_size,
                 tree_size_hint(_opts.root)),
      _min_size(_opts.min_size),
      _scanner(_opts.root, _excludes, _opts.min_size, _opts.include_cloud),
      _names(_opts.ext_mode(), _opts.name_require_equal_size),
      _started(_clock()),
      _phase_started(_started) {
  if (_opts.mode == find_mode_t::size) {
    _verifier = std::make_unique<digest_verifier_t>(_md, _min_size, _gate, _board);
  }
  oss(log_to(log_lvl_t::log))
      << "[log] root: " << _opts.root
      << ", min size: " << utils::format_size(_opts.min_size)
      << ", budget: " << _opts.time_budget_min
      << "min, excludes: " << _excludes.entries().size() << '\n';
  oss(log_to(log_lvl_t::log)) << "[log] list files..." << '\n';
  publish();
}

scan_session_t::~scan_session_t() { stop_workers(); }

void scan_session_t::publish() {
  const auto now = _clock();
  const auto min_size = _min_size.load();
  const auto budget = cn::duration_cast<cn::seconds>(_estimator.budget().requested);
  _board.update([&](progress_t &progress) {
    _scanner.fill(progress);
    progress.state = _state;
    progress.elapsed = cn::duration_cast<cn::milliseconds>(now - _started);
    progress.phase_elapsed = cn::duration_cast<cn::milliseconds>(
        now - _phase_started - _phase_paused);
    progress.min_size = min_size;
    progress.budget = budget;
    if (_state != run_state_t::needs_tuning) {
      progress.suggest_min_size.reset();
    }
  });
}

void scan_session_t::enter_phase(run_state_t state) {
  _state = state;
  _phase_started = _clock();
  _phase_paused = steady_t::duration(0);
}

checkpoint_t scan_session_t::advance() {
  switch (_state) {
    case run_state_t::scanning: {
      const auto st = _stop.get_token();
      for (auto i = 0UL; i < scan_batch; ++i) {
        auto record = _scanner.next(st);
        if (!record) {
          break;
        }
        if (_opts.mode == find_mode_t::size) {
          _sizes.add(std::move(*record));
        } else {
          _names.add(std::move(*record));
        }
      }
      if (st.stop_requested()) {
        conclude(run_state_t::cancelled);
        return checkpoint_t::finished;
      }
      if (!_scanner.done()) {
        return check_budget();
      }
      publish();
      const auto walked = _board.snapshot();
      oss(log_to(log_lvl_t::log))
          << "[log] elapsed: " << walked.elapsed.count() << "ms" << '\n';
      oss(log_to(log_lvl_t::log))
          << "[log] file count: " << walked.files_kept
          << ", skipped: " << walked.files_skipped << '\n';
      if (_opts.mode == find_mode_t::name) {
        _results.add(_names.take_groups());
        conclude(run_state_t::done);
        return checkpoint_t::finished;
      }
      start_hashing();
      return _state == run_state_t::hashing ? checkpoint_t::running
                                            : checkpoint_t::finished;
    }

    case run_state_t::hashing: {
      bool idle = false;
      {
        std::unique_lock lk(_jobs_mtx);
        idle = _jobs_cv.wait_for(lk, poll_interval,
                                 [this] { return _jobs_left == 0; });
      }
      if (_stop.stop_requested()) {
        stop_workers();
        _results.add(_verifier->take_groups());
        conclude(run_state_t::cancelled);
        return checkpoint_t::finished;
      }
      if (!idle) {
        return check_budget();
      }
      _pool->join();
      _results.add(_verifier->take_groups());
      conclude(run_state_t::done);
      return checkpoint_t::finished;
    }

    case run_state_t::needs_tuning:
      if (_stop.stop_requested()) {
        stop_workers();
        if (_verifier) {
          _results.add(_verifier->take_groups());
        }
        conclude(run_state_t::cancelled);
        return checkpoint_t::finished;
      }
      return checkpoint_t::budget_exceeded;

    case run_state_t::done:
    case run_state_t::cancelled:
      break;
  }
  return checkpoint_t::finished;
}

checkpoint_t scan_session_t::check_budget() {
  publish();
  const auto check = _estimator.observe(_board.snapshot());
  if (check.exceeded) {
    _paused_state = _state;
    _state = run_state_t::needs_tuning;
    _pause_started = _clock();
    if (_paused_state == run_state_t::hashing) {
      _gate.close();
    }
  }
  _board.update([&](progress_t &progress) {
    progress.eta = check.eta;
    if (check.exceeded) {
      progress.state = run_state_t::needs_tuning;
      progress.suggest_min_size = check.suggest_min_size;
    }
  });
  if (!check.exceeded) {
    return checkpoint_t::running;
  }
  oss(log_to(log_lvl_t::log))
      << "[log] eta " << check.eta.value_or(cn::seconds(0)).count()
      << "s exceeds time budget, suggested min size: "
      << utils::format_size(check.suggest_min_size) << '\n';
  return checkpoint_t::budget_exceeded;
}

void scan_session_t::leave_pause() {
  _phase_paused += _clock() - _pause_started;
  _state = _paused_state;
  publish();
  if (_state == run_state_t::hashing) {
    _gate.open();
  }
}

void scan_session_t::resume_continue() {
  if (_state != run_state_t::needs_tuning) {
    throw error_t("no budget decision pending");
  }
  _estimator.acknowledge();
  oss(log_to(log_lvl_t::log)) << "[log] continue over budget" << '\n';
  leave_pause();
}

void scan_session_t::resume_raise(uint64_t min_size) {
  if (_state != run_state_t::needs_tuning) {
    throw error_t("no budget decision pending");
  }
  _estimator.raise(min_size);
  _min_size.store(min_size);
  _scanner.raise_min_size(min_size);
  _sizes.drop_below(min_size);
  _names.drop_below(min_size);
  if (_verifier) {
    _verifier->settle_below(min_size);
  }
  oss(log_to(log_lvl_t::log))
      << "[log] min size raised to " << utils::format_size(min_size) << '\n';
  leave_pause();
}

void scan_session_t::start_hashing() {
  auto candidates = _sizes.take_candidates();
  // long jobs first
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const size_bucket_t &lhs, const size_bucket_t &rhs) {
                     return lhs.size * lhs.files.size() >
                            rhs.size * rhs.files.size();
                   });
  uint64_t files = 0;
  uint64_t bytes = 0;
  for (const auto &bucket : candidates) {
    files += bucket.files.size();
    bytes += bucket.files.size() * bucket.size;
  }
  _board.update([&](progress_t &progress) {
    progress.hash_total = files;
    progress.hash_bytes_total = bytes;
  });
  oss(log_to(log_lvl_t::log)) << "[log] detect duplicates..." << '\n';
  oss(log_to(log_lvl_t::log))
      << "[log] job count: " << candidates.size() << ", files: " << files
      << ", bytes: " << utils::format_size(bytes) << '\n';
  if (candidates.empty()) {
    conclude(run_state_t::done);
    return;
  }

  enter_phase(run_state_t::hashing);
  _jobs_left = candidates.size();
  for (const auto &bucket : candidates) {
    _verifier->expect(bucket);
  }
  _pool = std::make_unique<boost::asio::thread_pool>(_opts.jobs);
  for (auto &bucket : candidates) {
    const auto size = bucket.size;
    boost::asio::post(*_pool, [this, size, bucket = std::move(bucket)]() mutable {
      try {
        _verifier->verify(std::move(bucket), _stop.get_token());
      } catch (const std::exception &e) {
        oss(log_to(log_lvl_t::err))
            << "[err] verify failed for size " << size << ": " << e.what()
            << '\n';
      }
      {
        std::lock_guard lk(_jobs_mtx);
        --_jobs_left;
      }
      _jobs_cv.notify_all();
    });
  }
  publish();
}

void scan_session_t::stop_workers() noexcept {
  if (!_pool) {
    return;
  }
  _stop.request_stop();
  _gate.open();
  _pool->join();
}

void scan_session_t::conclude(run_state_t state) {
  _state = state;
  _results.drop_below(_min_size.load());
  publish();
  _board.update([state](progress_t &progress) {
    if (state == run_state_t::done) {
      progress.eta = cn::seconds(0);
    }
  });
  oss(log_to(log_lvl_t::log))
      << "[log] " << to_string(state) << ", elapsed: "
      << _board.snapshot().elapsed.count() << "ms" << '\n';
}

scan_report_t scan_session_t::finish() {
  if (_state != run_state_t::done && _state != run_state_t::cancelled) {
    throw error_t("scan still running");
  }
  auto report =
      _results.finish(_board.snapshot(), _state == run_state_t::done);
  oss(log_to(log_lvl_t::log))
      << "[log] duplicate group count: " << report.groups.size()
      << ", wasted: " << utils::format_size(report.total_wasted) << '\n';
  return report;
}

scan_report_t find_duplicates(options_t opts, const budget_handler_t &on_budget,
                              std::stop_token st) {
  scan_session_t session(std::move(opts));
  std::stop_callback on_stop(st, [&session]() noexcept { session.cancel(); });
  while (true) {
    switch (session.advance()) {
      case checkpoint_t::running:
        break;
      case checkpoint_t::budget_exceeded: {
        std::optional<uint64_t> raise_to;
        if (on_budget) {
          raise_to = on_budget(session.progress());
        }
        if (raise_to) {
          session.resume_raise(*raise_to);
        } else {
          session.resume_continue();
        }
      } break;
      case checkpoint_t::finished:
        return session.finish();
    }
  }
}

}  // namespace detail_v1

}  // namespace dupfind
