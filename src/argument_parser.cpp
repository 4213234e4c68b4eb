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
 * @file argument_parser.cpp
 * @brief This file implements a CLI argument parser.
 */
#include "tftpsrv/detail/argument_parser.hpp"

#include <algorithm>
namespace tftpsrv::detail {
namespace {
/** @brief True for "-" and "--", which never take a value. */
auto is_bare(std::string_view flag) noexcept -> bool
{
  return !flag.empty() &&
         // NOLINTNEXTLINE(readability-identifier-length)
         std::ranges::all_of(flag, [](char ch) { return ch == '-'; });
}

/** @brief Splits `--flag=value` into its parts. */
auto split_long(std::string_view token) -> argument_parser::option
{
  auto opt = argument_parser::option{.flag = token};
  if (token.size() > 2 && token[1] == '-')
  {
    auto delim = token.find('=');
    if (delim != std::string_view::npos)
    {
      opt.flag = token.substr(0, delim);
      opt.value = token.substr(delim + 1);
    }
  }
  return opt;
}
} // namespace

auto argument_parser::parse(std::span<char const *const> args)
    -> std::vector<option>
{
  auto options = std::vector<option>{};
  if (args.empty())
    return options;

  auto current = option{};
  auto pending = false;
  for (const auto *arg : args.subspan(1))
  {
    auto token = std::string_view(arg);
    if (!token.empty() && token[0] == '-')
    {
      if (pending)
        options.push_back(current);

      current = split_long(token);
      pending = true;
      continue;
    }

    // A value completes the pending flag unless the flag is bare or has
    // already been given a value with '='.
    if (pending && current.value.empty() && !is_bare(current.flag))
    {
      current.value = token;
      options.push_back(current);
      pending = false;
      continue;
    }

    if (pending)
      options.push_back(current);

    current = option{.value = token};
    options.push_back(current);
    pending = false;
  }

  if (pending)
    options.push_back(current);

  return options;
}
} // namespace tftpsrv::detail
