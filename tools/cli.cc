#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "dupfind/error.hh"
#include "dupfind/estimator.hh"
#include "dupfind/finder.hh"
#include "dupfind/log.hh"
#include "dupfind/size.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

using namespace std::literals;

namespace {

enum class on_budget_t { ask, keep_going, raise };

constexpr auto usage =
    "usage: dupfind [--root DIR] [--mode size|name] [--min-size SIZE]\n"
    "               [--time-budget-min N] [--no-excludes] [--add-exclude DIR]...\n"
    "               [--include-cloud] [--ignore-ext | --keep-ext] [--same-size]\n"
    "               [-j jobs] [--digest NAME] [--on-budget ask|continue|raise]\n"
    "               [--log FILE] [-q] [-v] [-p/--print] [-h/--help]\n";

struct cli_t {
  dupfind::options_t opts;
  on_budget_t on_budget = on_budget_t::ask;
  std::string log_path;
  bool print_out = false;
  bool quiet = false;
  bool verbose = false;
};

// throws config_error_t, returns nullopt on --help
std::optional<cli_t> parse_args(int argc, char *argv[]) {
  cli_t cli;
  auto value = [&](int &i, std::string_view name) -> std::string {
    ++i;
    if (i >= argc) {
      throw dupfind::config_error_t("missing value for " + std::string(name));
    }
    return argv[i];
  };
  auto number = [](const std::string &str, std::string_view name) -> uint32_t {
    try {
      std::size_t pos = 0;
      const auto val = std::stoul(str, &pos);
      if (pos != str.size() || val > UINT32_MAX) {
        throw std::out_of_range(str);
      }
      return (uint32_t)val;
    } catch (const std::logic_error &) {
      throw dupfind::config_error_t("invalid " + std::string(name) + ": " + str);
    }
  };

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--root"sv) {
      cli.opts.root = value(i, arg);
    } else if (arg == "--mode"sv) {
      const auto mode = value(i, arg);
      if (mode == "size") {
        cli.opts.mode = dupfind::find_mode_t::size;
      } else if (mode == "name") {
        cli.opts.mode = dupfind::find_mode_t::name;
      } else {
        throw dupfind::config_error_t("unknown mode: " + mode);
      }
    } else if (arg == "--min-size"sv) {
      cli.opts.min_size = dupfind::utils::parse_size(value(i, arg));
    } else if (arg == "--time-budget-min"sv) {
      cli.opts.time_budget_min = number(value(i, arg), "time budget");
    } else if (arg == "--no-excludes"sv) {
      cli.opts.no_excludes = true;
    } else if (arg == "--add-exclude"sv) {
      cli.opts.add_excludes.emplace_back(value(i, arg));
    } else if (arg == "--include-cloud"sv) {
      cli.opts.include_cloud = true;
    } else if (arg == "--ignore-ext"sv) {
      cli.opts.ignore_ext = true;
    } else if (arg == "--keep-ext"sv) {
      cli.opts.keep_ext = true;
    } else if (arg == "--same-size"sv) {
      cli.opts.name_require_equal_size = true;
    } else if (arg == "-j"sv) {
      cli.opts.jobs = number(value(i, arg), "jobs");
    } else if (arg == "--digest"sv) {
      cli.opts.digest_name = value(i, arg);
    } else if (arg == "--on-budget"sv) {
      const auto policy = value(i, arg);
      if (policy == "ask") {
        cli.on_budget = on_budget_t::ask;
      } else if (policy == "continue") {
        cli.on_budget = on_budget_t::keep_going;
      } else if (policy == "raise") {
        cli.on_budget = on_budget_t::raise;
      } else {
        throw dupfind::config_error_t("unknown budget policy: " + policy);
      }
    } else if (arg == "--log"sv) {
      cli.log_path = value(i, arg);
    } else if (arg == "-q"sv || arg == "--quiet"sv) {
      cli.quiet = true;
    } else if (arg == "-v"sv || arg == "--verbose"sv) {
      cli.verbose = true;
    } else if (arg == "-p"sv || arg == "--print"sv) {
      cli.print_out = true;
    } else if (arg == "-h"sv || arg == "--help"sv) {
      return std::nullopt;
    } else {
      throw dupfind::config_error_t("unknown option: " + std::string(arg));
    }
  }
  cli.opts.validate();
  return cli;
}

// nullopt continues, a value raises the threshold
std::optional<uint64_t> ask_user(const dupfind::progress_t &progress) {
  const auto suggest = progress.suggest_min_size.value_or(
      dupfind::suggest_min_size(progress.min_size));
  std::cerr << "time budget of " << progress.budget.count() / 60
            << " min will be exceeded (eta "
            << progress.eta.value_or(std::chrono::seconds(0)).count()
            << "s, elapsed " << progress.elapsed.count() / 1000 << "s)\n"
            << "min size is " << dupfind::utils::format_size(progress.min_size)
            << ". [c]ontinue, or [r]aise [SIZE] (default "
            << dupfind::utils::format_size(suggest) << ")? " << std::flush;
  while (true) {
    std::string line;
    if (!std::getline(std::cin, line)) {
      std::cerr << "\nno answer, continue" << std::endl;
      return std::nullopt;
    }
    std::istringstream iss(line);
    std::string choice;
    std::string size_str;
    iss >> choice >> size_str;
    if (choice.empty() || choice == "c") {
      return std::nullopt;
    }
    if (choice == "r") {
      if (size_str.empty()) {
        if (suggest > progress.min_size) {
          return suggest;
        }
        std::cerr << "no larger min size, continue" << std::endl;
        return std::nullopt;
      }
      try {
        const auto size = dupfind::utils::parse_size(size_str);
        if (size > progress.min_size) {
          return size;
        }
        std::cerr << "must be above the current min size: " << std::flush;
        continue;
      } catch (const dupfind::config_error_t &e) {
        std::cerr << e.what() << ": " << std::flush;
        continue;
      }
    }
    std::cerr << "c or r [SIZE]: " << std::flush;
  }
}

std::string format_mtime(std::filesystem::file_time_type mtime) {
  const auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      std::chrono::file_clock::to_sys(mtime));
  const auto tt = std::chrono::system_clock::to_time_t(sys);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M");
  return oss.str();
}

void print_report(const dupfind::scan_report_t &report) {
  for (const auto &group : report.groups) {
    std::cout << "---- " << group.key() << " - "
              << group.files().size() << " files, wasted "
              << dupfind::utils::format_size(group.wasted()) << '\n';
    for (const auto &file : group.files()) {
      std::cout << std::setw(10) << dupfind::utils::format_size(file.size())
                << "  " << format_mtime(file.mtime()) << "  "
                << file.path().string() << '\n';
    }
  }
  std::cout << "----\n"
            << report.groups.size() << " groups, "
            << dupfind::utils::format_size(report.total_wasted)
            << " reclaimable" << (report.complete ? "" : " (incomplete)")
            << '\n';
}

}  // namespace

int main(int argc, char *argv[]) {
  std::optional<cli_t> cli;
  try {
    cli = parse_args(argc, argv);
  } catch (const dupfind::config_error_t &e) {
    std::cerr << e.what() << '\n' << usage;
    return 1;
  }
  if (!cli) {
    std::cerr << usage;
    return 0;
  }

  std::ofstream log_file;
  if (!cli->log_path.empty()) {
    log_file.open(cli->log_path, std::ios::out | std::ios::trunc);
    if (!log_file.is_open() || !log_file.good()) {
      std::cerr << "error opening logfile: " << cli->log_path << std::endl;
      return 1;
    }
    dupfind::set_log_stream(log_file);
  }
  if (cli->quiet) {
    dupfind::set_log_level(dupfind::log_lvl_t::err);
  } else if (cli->verbose) {
    dupfind::set_log_level(dupfind::log_lvl_t::verbose);
  }

  std::optional<dupfind::scan_session_t> session;
  try {
    session.emplace(cli->opts);
  } catch (const dupfind::config_error_t &e) {
    std::cerr << e.what() << '\n';
    return 1;
  }

  // SIGINT / SIGTERM request a cooperative stop
  boost::asio::io_context io;
  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  bool interrupted = false;
  signals.async_wait([&](const boost::system::error_code &ec, int signo) {
    if (!ec) {
      dupfind::oss(dupfind::log_to(dupfind::log_lvl_t::warn))
          << "[warn] signal " << signo << ", stopping" << '\n';
      interrupted = true;
      session->cancel();
    }
  });
  std::thread signal_thread([&io] { io.run(); });

  const bool interactive = ::isatty(STDIN_FILENO) != 0;
  auto last_report = std::chrono::steady_clock::now();
  dupfind::scan_report_t report;
  try {
    while (true) {
      const auto checkpoint = session->advance();
      if (checkpoint == dupfind::checkpoint_t::finished) {
        break;
      }
      if (checkpoint == dupfind::checkpoint_t::budget_exceeded) {
        const auto progress = session->progress();
        std::optional<uint64_t> raise_to;
        if (cli->on_budget == on_budget_t::raise) {
          // at the ceiling already, nothing left to raise to
          if (progress.suggest_min_size &&
              *progress.suggest_min_size > progress.min_size) {
            raise_to = progress.suggest_min_size;
          }
        } else if (cli->on_budget == on_budget_t::ask && interactive) {
          raise_to = ask_user(progress);
        }
        if (raise_to) {
          session->resume_raise(*raise_to);
        } else {
          session->resume_continue();
        }
        continue;
      }
      const auto now = std::chrono::steady_clock::now();
      if (now - last_report >= 5s) {
        last_report = now;
        const auto p = session->progress();
        dupfind::oss(dupfind::log_to(dupfind::log_lvl_t::log))
            << "[log] " << dupfind::to_string(p.state) << ": files "
            << p.files_visited << ", kept " << p.files_kept << ", "
            << dupfind::utils::format_size(p.bytes_visited) << ", dirs pending "
            << p.dirs_pending << ", hashed " << p.hash_done << "/"
            << p.hash_total << ", eta "
            << (p.eta ? std::to_string(p.eta->count()) + "s" : "-"s) << '\n';
      }
    }
    report = session->finish();
  } catch (const dupfind::error_t &e) {
    dupfind::oss(dupfind::log_to(dupfind::log_lvl_t::err))
        << "[err] " << e.what() << '\n';
    io.stop();
    signal_thread.join();
    return 1;
  }

  io.stop();
  signal_thread.join();

  if (cli->print_out) {
    print_report(report);
  } else {
    std::cout << report.groups.size() << " groups, "
              << dupfind::utils::format_size(report.total_wasted)
              << " reclaimable" << (report.complete ? "" : " (incomplete)")
              << '\n';
  }
  return interrupted ? 130 : 0;
}
