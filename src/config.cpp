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
 * @file config.cpp
 * @brief This file implements the process-wide server configuration.
 */
#include "tftpsrv/config.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>
namespace tftpsrv::config {
/** @brief Parses a numeric environment variable or returns fallback. */
template <typename T>
static auto from_env(const char *name, T fallback) noexcept -> T
{
  const char *value = std::getenv(name);
  if (!value)
    return fallback;

  auto str = std::string_view(value);
  auto result = T{};
  auto [ptr, err] = std::from_chars(str.data(), str.data() + str.size(), result);
  if (err != std::errc{} || ptr != str.data() + str.size())
    return fallback;

  return result;
}

auto root_directory() noexcept -> const std::filesystem::path &
{
  static const auto root_path = []() noexcept {
    if (const char *path = std::getenv(ROOT_ENV))
      return std::filesystem::path(path);

    return std::filesystem::path(".");
  }();

  return root_path;
}

auto timeout() noexcept -> std::chrono::milliseconds
{
  static const auto value = []() noexcept {
    auto millis = from_env<long>(TIMEOUT_ENV, DEFAULT_TIMEOUT.count());
    if (millis <= 0)
      return DEFAULT_TIMEOUT;

    return std::chrono::milliseconds(millis);
  }();

  return value;
}

auto max_retries() noexcept -> unsigned
{
  static const auto value = from_env<unsigned>(RETRIES_ENV, DEFAULT_RETRIES);
  return value;
}

auto resolve(std::string_view filename) -> std::filesystem::path
{
  return root_directory() / std::filesystem::path(filename);
}
} // namespace tftpsrv::config
