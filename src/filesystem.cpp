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
 * @file filesystem.cpp
 * @brief This file implements the file storage backend.
 */
#include "tftpsrv/filesystem.hpp"

#include <cerrno>
#include <cstdio>
#include <format>
namespace tftpsrv::filesystem {
auto count() noexcept -> std::atomic<std::uint16_t> &
{
  static auto count = std::atomic<std::uint16_t>(0);
  return count;
}

auto tmpname(const std::filesystem::path &target) -> std::filesystem::path
{
  auto name = std::filesystem::path(prefix).concat(
      std::format("{}.{:05d}", target.filename().string(), count()++));
  return target.parent_path() / name;
}

// NOLINTBEGIN(cppcoreguidelines-owning-memory)
auto touch(const std::filesystem::path &file) -> std::error_code
{
  auto *fstream = std::fopen(file.c_str(), "a");
  if (!fstream)
    return {errno, std::system_category()};

  (void)std::fclose(fstream);
  return {};
}
// NOLINTEND(cppcoreguidelines-owning-memory)

auto open_read(const std::filesystem::path &file,
               std::error_code &err) -> std::shared_ptr<std::fstream>
{
  err.clear();
  if (std::filesystem::is_directory(file, err))
  {
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  auto fstream =
      std::make_shared<std::fstream>(file, std::ios::in | std::ios::binary);
  if (!fstream->is_open())
  {
    if (!std::filesystem::exists(file, err))
    {
      err = std::make_error_code(std::errc::no_such_file_or_directory);
      return {};
    }

    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  err.clear();
  return fstream;
}

auto open_write(const std::filesystem::path &file, std::filesystem::path &tmp,
                std::error_code &err) -> std::shared_ptr<std::fstream>
{
  err.clear();
  err = touch(file);
  if (err)
  {
    if (err != std::errc::no_such_file_or_directory)
      err = std::make_error_code(std::errc::permission_denied);

    return {};
  }

  tmp = tmpname(file);
  auto fstream = std::make_shared<std::fstream>(
      tmp, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!fstream->is_open())
  {
    tmp.clear();
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  return fstream;
}

auto read_chunk(std::fstream &file, std::span<char> buf,
                std::error_code &err) -> std::size_t
{
  err.clear();
  file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
  if (file.bad()) [[unlikely]]
  {
    err = std::make_error_code(std::errc::io_error); // GCOVR_EXCL_LINE
    return 0;                                         // GCOVR_EXCL_LINE
  }

  return static_cast<std::size_t>(file.gcount());
}

auto write_chunk(std::fstream &file,
                 std::span<const char> buf) -> std::error_code
{
  file.write(buf.data(), static_cast<std::streamsize>(buf.size()));
  file.flush();
  if (file.fail())
    return std::make_error_code(std::errc::io_error);

  return {};
}

auto commit(std::fstream &file, const std::filesystem::path &tmp,
            const std::filesystem::path &target) -> std::error_code
{
  file.close();
  if (file.fail())
    return std::make_error_code(std::errc::io_error);

  auto err = std::error_code();
  std::filesystem::rename(tmp, target, err);
  return err;
}
} // namespace tftpsrv::filesystem
