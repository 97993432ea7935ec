/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * tftpkit is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * tftpkit is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with tftpkit.  If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file main.cpp
 * @brief The tftpkit command line front-end.
 */
#include "tftpkit/detail/argument_parser.hpp"
#include "tftpkit/tftpkit.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <charconv>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>
using namespace tftpkit;

static constexpr char const *const usage =
    "usage: {0} serve [-a <ADDRESS>] [-p <PORT>] [-r <ROOT>] [-t <MS>] "
    "[-n <RETRIES>]\n"
    "       {0} get [-p <PORT>] [-m <MODE>] [-b <ADDRESS>] <HOST> <REMOTE> "
    "[<LOCAL>]\n"
    "       {0} put [-p <PORT>] [-m <MODE>] [-b <ADDRESS>] <HOST> <LOCAL> "
    "[<REMOTE>]\n"
    "\n"
    "Options:\n"
    "-h, --help                         print this help.\n"
    "-a, --address=<ADDRESS>            set the address to listen on "
    "(default: ::).\n"
    "-p, --port=<PORT>                  set the server port (default: 69).\n"
    "-r, --root=<ROOT>                  set the directory to serve (default: "
    ".).\n"
    "-t, --timeout=<MS>                 set the retransmission timeout "
    "(default: 1000).\n"
    "-n, --retries=<RETRIES>            set the number of timeouts tolerated "
    "(default: 5).\n"
    "-m, --mode=<MODE>                  set the transfer mode (octet, "
    "netascii).\n"
    "-b, --bind=<ADDRESS>               set the local address of the client.\n"
    "-l, --log-level=<LEVEL>            set the log-level (critical, error, "
    "warn, info, debug)\n"
    "    --log-file=<PATH>              also write the log to PATH.\n";

static auto signal_mask() -> sigset_t *
{
  static auto set = sigset_t{};
  static sigset_t *setp = nullptr;
  static auto mtx = std::mutex{};

  if (auto lock = std::lock_guard{mtx}; !setp)
  {
    sigemptyset(&set);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGINT);
    setp = &set;
  }
  return setp;
}

/** @brief The first signal drains the server, the second one stops it. */
static auto signal_handler(server_handle &server) -> std::jthread
{
  static const sigset_t *sigmask = nullptr;
  static auto mtx = std::mutex();

  if (auto lock = std::lock_guard{mtx}; !sigmask)
  {
    sigmask = signal_mask();
    pthread_sigmask(SIG_BLOCK, sigmask, nullptr);

    return std::jthread([&](const std::stop_token &token) noexcept {
      static const auto timeout = timespec{.tv_sec = 0, .tv_nsec = 50000000};

      while (!token.stop_requested())
      {
        switch (sigtimedwait(sigmask, nullptr, &timeout))
        {
          case SIGTERM:
          case SIGHUP:
          case SIGINT:
            if (!server.draining())
            {
              spdlog::info("Stopping once {} active sessions finish.",
                           server.active());
              server.drain();
              break;
            }

            server.terminate();
            break;

          default:
            break;
        }
      }
    });
  }

  return {};
}

struct config {
  // NOLINTNEXTLINE(performance-enum-size)
  enum command_t : std::uint8_t { NONE, SERVE, GET, PUT };

  command_t command = NONE;
  server_config server;
  client_config client;
  messages::mode_t mode = messages::OCTET;
  std::vector<std::string_view> args;
  std::string_view log_file;
};

static auto set_loglevel(std::string_view value) -> int
{
  using std::tolower;
  auto level = std::string(value);
  std::ranges::transform(level, level.begin(),
                         [](unsigned char chr) { return tolower(chr); });

  auto spdlog_level = spdlog::level::from_str(level);
  if (spdlog_level != spdlog::level::off || level == "off")
  {
    spdlog::set_level(spdlog_level);
    return 0;
  }

  std::cerr << std::format("Unrecognized log level: {}\n", value)
            << "Valid log levels are: ";

  int count = 0;
  for (const auto &level_str : spdlog::level::level_string_views)
  {
    if (count++ > 0)
      std::cerr << ", ";

    std::cerr << std::string(level_str.begin(), level_str.end());
  }
  std::cerr << "\n";
  return -1;
}

static auto set_logfile(std::string_view path) -> int
{
  try
  {
    auto sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(std::string(path));
    spdlog::default_logger()->sinks().push_back(std::move(sink));
    return 0;
  }
  catch (const spdlog::spdlog_ex &ex)
  {
    std::cerr << std::format("Unable to open log file {}: {}\n", path,
                             ex.what());
    return -1;
  }
}

template <typename T>
static auto parse_number(std::string_view value, T &out) -> bool
{
  auto [ptr, err] = std::from_chars(value.cbegin(), value.cend(), out);
  return err == std::errc{} && ptr == value.cend();
}

// NOLINTNEXTLINE
auto parse_args(int argc, char const *const *argv) -> std::optional<config>
{
  using namespace tftpkit::detail;

  auto conf = config();
  auto progname = std::filesystem::path(*argv).stem();

  auto error = [&]() -> std::optional<config> {
    std::cerr << std::format(usage, progname.c_str());
    return std::nullopt;
  };

  for (const auto &option : argument_parser::parse(argc, argv))
  {
    const auto &[flag, value] = option;
    if (!flag.empty()) // options with flags.
    {
      if (flag == "-h" || flag == "--help")
      {
        std::cout << std::format(usage, progname.c_str());
        return std::nullopt;
      }

      if (flag == "-a" || flag == "--address")
      {
        conf.server.address = value;
      }
      else if (flag == "-p" || flag == "--port")
      {
        if (!parse_number(value, conf.server.port))
        {
          std::cerr << std::format("Invalid port number: {}\n", value);
          return error();
        }
        conf.client.port = conf.server.port;
      }
      else if (flag == "-r" || flag == "--root")
      {
        conf.server.root = value;
      }
      else if (flag == "-t" || flag == "--timeout")
      {
        auto timeout = 0U;
        if (!parse_number(value, timeout) || timeout == 0)
        {
          std::cerr << std::format("Invalid timeout: {}\n", value);
          return error();
        }
        conf.server.session.timeout = std::chrono::milliseconds(timeout);
        conf.client.session.timeout = conf.server.session.timeout;
      }
      else if (flag == "-n" || flag == "--retries")
      {
        if (!parse_number(value, conf.server.session.max_retries) ||
            conf.server.session.max_retries == 0)
        {
          std::cerr << std::format("Invalid retry count: {}\n", value);
          return error();
        }
        conf.client.session.max_retries = conf.server.session.max_retries;
      }
      else if (flag == "-m" || flag == "--mode")
      {
        conf.mode = to_mode(value);
        if (conf.mode != messages::OCTET && conf.mode != messages::NETASCII)
        {
          std::cerr << std::format("Unsupported transfer mode: {}\n", value);
          return error();
        }
      }
      else if (flag == "-b" || flag == "--bind")
      {
        conf.client.local_address = value;
      }
      else if (flag == "-l" || flag == "--log-level")
      {
        if (set_loglevel(value))
          return error();
      }
      else if (flag == "--log-file")
      {
        conf.log_file = value;
      }
      else
      {
        std::cerr << std::format("Unknown flag: {}\n", flag);
        return error();
      }
    }

    if (value.empty() || !flag.empty())
      continue;

    // Positional arguments.
    if (conf.command != config::NONE)
    {
      conf.args.push_back(value);
    }
    else if (value == "serve")
    {
      conf.command = config::SERVE;
    }
    else if (value == "get")
    {
      conf.command = config::GET;
    }
    else if (value == "put")
    {
      conf.command = config::PUT;
    }
    else
    {
      std::cerr << std::format("Unknown command: {}\n", value);
      return error();
    }
  }

  const auto nargs = conf.args.size();
  switch (conf.command)
  {
    case config::SERVE:
      if (nargs != 0)
        return error();
      break;

    case config::GET:
    case config::PUT:
      if (nargs < 2 || nargs > 3)
        return error();
      break;

    default:
      return error();
  }

  return {conf};
}

static auto serve(const config &conf) -> int
{
  auto err = std::error_code();
  auto server = start_server(conf.server, {}, err);
  if (!server)
  {
    std::cerr << std::format("Unable to start the server: {}\n",
                             err.message());
    return 1;
  }

  auto sighandler = signal_handler(*server);

  using clock = std::chrono::steady_clock;
  auto drain_deadline = std::optional<clock::time_point>();
  while (!server->wait_for(std::chrono::milliseconds(50)))
  {
    if (!server->draining())
      continue;

    if (!drain_deadline)
      drain_deadline = clock::now() + server_handle::DEFAULT_GRACE;

    if (server->active() == 0 || clock::now() >= *drain_deadline)
      server->terminate();
  }

  server->stop();
  return 0;
}

static auto print_progress(const transfer_event &event) -> void
{
  using enum transfer_event::kind_t;
  if (event.kind != SESSION_COMPLETED)
    return;

  const auto &stats = *event.statistics;
  std::cout << std::format("Transferred {} bytes in {:.3f} seconds ({:.2f} "
                           "kbps).\n",
                           stats.bytes, stats.duration().count(),
                           stats.kbps());
}

static auto transfer(const config &conf) -> int
{
  const auto &host = conf.args[0];
  auto result = transfer_result();

  if (conf.command == config::GET)
  {
    const auto remote = conf.args[1];
    const auto local = (conf.args.size() > 2)
                           ? std::filesystem::path(conf.args[2])
                           : std::filesystem::path(remote).filename();
    result = download_file(host, remote, local, conf.client, print_progress,
                           conf.mode);
  }
  else
  {
    const auto local = std::filesystem::path(conf.args[1]);
    const auto remote = (conf.args.size() > 2)
                            ? std::string(conf.args[2])
                            : local.filename().string();
    result = upload_file(host, local, remote, conf.client, print_progress,
                         conf.mode);
  }

  if (!result)
  {
    std::cerr << std::format("Transfer failed: {}\n", result.reason);
    return 1;
  }

  return 0;
}

auto main(int argc, char *argv[]) -> int
{
  spdlog::cfg::load_env_levels();

  auto conf = parse_args(argc, argv);
  if (!conf)
    return 2;

  if (!conf->log_file.empty() && set_logfile(conf->log_file))
    return 2;

  if (conf->command == config::SERVE)
    return serve(*conf);

  return transfer(*conf);
}
