/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * tftpsrv is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * tftpsrv is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with tftpsrv.  If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file main.cpp
 * @brief The tftpsrv executable.
 */
#include "tftpsrv/config.hpp"
#include "tftpsrv/detail/argument_parser.hpp"
#include "tftpsrv/tftp_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>

using namespace net::service;
using namespace tftpsrv;

using tftp_server = context_thread<server>;

static constexpr unsigned short PORT = 69;
static constexpr char const *const usage =
    "usage: {} [-l <LEVEL>] [-p <PORT>] [-d <ROOT>] [-t <TIMEOUT_MS>] "
    "[-r <RETRIES>]\n"
    "\n"
    "Options:\n"
    "-h, --help                   print this help.\n"
    "-l, --log-level=<LEVEL>      set the log-level (critical, error, "
    "warn, info, debug)\n"
    "-p, --port=<PORT>            set the port to listen on (default: 69).\n"
    "-d, --root=<ROOT>            serve files from ROOT (default: .).\n"
    "-t, --timeout=<TIMEOUT_MS>   retransmission timeout in milliseconds "
    "(default: 3000).\n"
    "-r, --retries=<RETRIES>      retransmissions before a transfer is "
    "abandoned (default: 5).\n";

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

static auto signal_handler(tftp_server &server) -> std::jthread
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
        using enum tftp_server::signals;
        switch (sigtimedwait(sigmask, nullptr, &timeout))
        {
          case SIGTERM:
          case SIGHUP:
          case SIGINT:
            server.signal(terminate);
            break;

          default:
            break;
        }
      }
    });
  }

  return {};
}

struct options {
  unsigned short port = PORT;
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

/** @brief Exports a numeric option after checking that it parses. */
static auto set_number(const char *name, std::string_view value) -> int
{
  auto number = 0UL;
  auto [ptr, err] = std::from_chars(value.cbegin(), value.cend(), number);
  if (value.empty() || err != std::errc{} || ptr != value.cend())
  {
    std::cerr << std::format("Invalid value for {}: {}\n", name, value);
    return -1;
  }

  if (setenv(name, std::string(value).c_str(), 1))
  {
    std::cerr << std::format(
        "Unable to set {}, error: {}\n", name,
        std::error_code(errno, std::system_category()).message());
    return -1;
  }
  return 0;
}

static auto set_root(std::string_view value) -> int
{
  auto err = std::error_code();
  auto path = std::filesystem::path(value);
  if (!std::filesystem::is_directory(path, err))
  {
    std::cerr << std::format("Not a directory: {}\n", value);
    return -1;
  }

  if (setenv(config::ROOT_ENV, path.c_str(), 1))
  {
    std::cerr << std::format(
        "Unable to set {}, error: {}\n", config::ROOT_ENV,
        std::error_code(errno, std::system_category()).message());
    return -1;
  }
  return 0;
}

// NOLINTNEXTLINE
auto parse_args(int argc, char const *const *argv) -> std::optional<options>
{
  using namespace tftpsrv::detail;

  auto opts = options();
  auto progname = std::filesystem::path(*argv).stem();

  auto error = [&]() -> std::optional<options> {
    std::cerr << std::format(usage, progname.c_str());
    return std::nullopt;
  };

  for (const auto &option : argument_parser::parse(argc, argv))
  {
    const auto &[flag, value] = option;
    if (flag.empty())
    {
      std::cerr << std::format("Unexpected argument: {}\n", value);
      return error();
    }

    if (flag == "-h" || flag == "--help")
    {
      std::cout << std::format(usage, progname.c_str());
      return std::nullopt;
    }

    if (flag == "-l" || flag == "--log-level")
    {
      if (!set_loglevel(value))
        continue;

      return error();
    }

    if (flag == "-p" || flag == "--port")
    {
      auto [ptr, err] = std::from_chars(value.cbegin(), value.cend(), opts.port);
      if (value.empty() || err != std::errc{})
      {
        std::cerr << std::format("Invalid port number: {}\n", value);
        return error();
      }
    }
    else if (flag == "-d" || flag == "--root")
    {
      if (set_root(value))
        return error();
    }
    else if (flag == "-t" || flag == "--timeout")
    {
      if (set_number(config::TIMEOUT_ENV, value))
        return error();
    }
    else if (flag == "-r" || flag == "--retries")
    {
      if (set_number(config::RETRIES_ENV, value))
        return error();
    }
    else
    {
      std::cerr << std::format("Unknown flag: {}\n", flag);
      return error();
    }
  }

  return {opts};
}

auto main(int argc, char *argv[]) -> int
{
  using namespace io::socket;

  auto opts = parse_args(argc, argv);
  if (!opts)
    return 0;

  auto address = socket_address<sockaddr_in6>{};
  address->sin6_family = AF_INET6;
  address->sin6_port = htons(opts->port);

  auto server = tftp_server();

  auto sighandler = signal_handler(server);

  spdlog::info("TFTP server serving {} on UDP port {}.",
               config::root_directory().c_str(), opts->port);
  spdlog::debug("Timeout {}ms, {} retries.", config::timeout().count(),
                config::max_retries());

  server.start(address);
  server.state.wait(server.PENDING);
  server.state.wait(server.STARTED);

  spdlog::info("TFTP server stopped.");
  return 0;
}
