#pragma once

#include <openssl/evp.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>

#include "dupfind/config.hh"
#include "dupfind/estimator.hh"
#include "dupfind/exclusion.hh"
#include "dupfind/gate.hh"
#include "dupfind/name_finder.hh"
#include "dupfind/options.hh"
#include "dupfind/progress.hh"
#include "dupfind/result.hh"
#include "dupfind/scanner.hh"
#include "dupfind/size_finder.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio/thread_pool.hpp>

namespace dupfind {

inline namespace detail_v1 {

// what the driving loop has to do after advance()
enum class checkpoint_t {
  running,          // call advance() again
  budget_exceeded,  // call resume_continue() or resume_raise() first
  finished          // call finish()
};

/**
 * @brief one duplicate search. the owner drives it by calling advance() in a
 * loop; each call does a bounded unit of work (a batch of directory entries,
 * or one poll of the hashing workers) and reports back, so the owner can
 * report progress, answer a budget signal or cancel between calls.
 *
 * nothing is shared between sessions, a rescan is a new session.
 */
class DUPFIND_EXPORT scan_session_t {
 public:
  using steady_t = std::chrono::steady_clock;
  // time source of elapsed and phase times
  using clock_fn_t = std::function<steady_t::time_point()>;

 private:
  options_t _opts;
  clock_fn_t _clock;
  const EVP_MD *_md = nullptr;
  exclusion_set_t _excludes;
  std::stop_source _stop;

  progress_board_t _board;
  budget_estimator_t _estimator;
  std::atomic<uint64_t> _min_size;
  scanner_t _scanner;
  size_bucketer_t _sizes;
  name_bucketer_t _names;
  result_aggregator_t _results;

  gate_t _gate;
  std::unique_ptr<digest_verifier_t> _verifier;
  std::unique_ptr<boost::asio::thread_pool> _pool;
  std::mutex _jobs_mtx;
  std::condition_variable _jobs_cv;
  std::size_t _jobs_left = 0;

  run_state_t _state = run_state_t::scanning;
  run_state_t _paused_state = run_state_t::scanning;
  steady_t::time_point _started;
  steady_t::time_point _phase_started;
  steady_t::time_point _pause_started;
  steady_t::duration _phase_paused{0};

  void publish();
  checkpoint_t check_budget();
  void enter_phase(run_state_t state);
  void leave_pause();
  void start_hashing();
  void stop_workers() noexcept;
  void conclude(run_state_t state);

 public:
  /**
   * @param clock replaced in tests to drive the time budget
   * @throws config_error_t if the options are invalid
   */
  explicit scan_session_t(options_t opts, clock_fn_t clock = steady_t::now);
  ~scan_session_t();

  scan_session_t(const scan_session_t &) = delete;
  scan_session_t &operator=(const scan_session_t &) = delete;

  checkpoint_t advance();

  /**
   * @brief keep going with the current threshold, no further budget signal
   * @throws error_t if no budget decision is pending
   */
  void resume_continue();

  /**
   * @brief keep going with a higher threshold. records already found below
   * it are dropped and never re-included; records above it are kept.
   * queued size buckets below it are skipped without being read.
   *
   * @throws config_error_t if min_size does not exceed the current threshold
   * @throws error_t if no budget decision is pending
   */
  void resume_raise(uint64_t min_size);

  // stop walking and hashing as soon as possible, thread-safe
  void cancel() noexcept { _stop.request_stop(); }
  std::stop_token stop_token() const noexcept { return _stop.get_token(); }

  // thread-safe copy of the live counters
  progress_t progress() const { return _board.snapshot(); }
  inline run_state_t state() const noexcept { return _state; }
  inline const time_budget_t &budget() const noexcept {
    return _estimator.budget();
  }
  inline const exclusion_set_t &excludes() const noexcept { return _excludes; }
  // hashing counters, null in name mode
  inline const verify_stats_t *verify_stats() const noexcept {
    return _verifier ? &_verifier->stats() : nullptr;
  }

  /**
   * @brief ranked groups; after a cancel only fully verified groups
   * @throws error_t if advance() has not reported finished
   */
  scan_report_t finish();
};

/**
 * @brief answer to an exceeded budget: nullopt continues, a value raises
 * the threshold to it
 */
using budget_handler_t = std::function<std::optional<uint64_t>(const progress_t &)>;

/**
 * @brief run a whole session to completion
 *
 * @param opts validated before scanning
 * @param on_budget asked on every budget signal, empty means continue
 * @param st cancels the run, the report is then partial
 */
DUPFIND_EXPORT scan_report_t find_duplicates(options_t opts,
                                             const budget_handler_t &on_budget = {},
                                             std::stop_token st = {});

}  // namespace detail_v1

}  // namespace dupfind
