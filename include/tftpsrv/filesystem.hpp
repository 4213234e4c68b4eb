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
 * @file filesystem.hpp
 * @brief This file declares the file storage backend used by transfers.
 */
#pragma once
#ifndef TFTPSRV_FILESYSTEM_HPP
#define TFTPSRV_FILESYSTEM_HPP
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <system_error>
/** @brief For TFTP file storage. */
namespace tftpsrv::filesystem {
/** @brief The temporary file prefix used for generating temporary filenames. */
constexpr auto prefix = ".tftpsrv.";

/**
 * @brief Returns a reference to the atomic counter for temporary file
 * generation.
 * @return Reference to an atomic uint16_t counter used for unique filename
 * generation.
 */
auto count() noexcept -> std::atomic<std::uint16_t> &;

/**
 * @brief Generates the next temporary filename for a write target.
 * @details The temporary file lives in the target's directory so that the
 * final rename never crosses a filesystem boundary.
 * @param target The file that will eventually be written.
 * @return Path to a uniquely generated temporary file (not yet created).
 */
auto tmpname(const std::filesystem::path &target) -> std::filesystem::path;

/**
 * @brief Creates a file or updates its modification time if it exists.
 * @param file Path to the file to touch.
 * @return Error code indicating success or failure of the operation.
 */
auto touch(const std::filesystem::path &file) -> std::error_code;

/**
 * @brief Opens a file for reading.
 * @param file The file to open.
 * @param[out] err Cleared on success, no_such_file_or_directory or
 * permission_denied on error.
 * @returns A shared pointer to an open file stream.
 */
auto open_read(const std::filesystem::path &file,
               std::error_code &err) -> std::shared_ptr<std::fstream>;

/**
 * @brief Opens a file for writing.
 * @details Writing a file to disk involves writing data to a
 * temporary file then renaming it to the target destination with commit().
 * The target itself is created immediately.
 * @param file The file to open.
 * @param[out] tmp The path of the temporary file.
 * @param[out] err An error code that is cleared on success and set on error.
 * @returns A shared pointer to an open file stream.
 */
auto open_write(const std::filesystem::path &file, std::filesystem::path &tmp,
                std::error_code &err) -> std::shared_ptr<std::fstream>;

/**
 * @brief Reads the next chunk of a file.
 * @param file The stream to read from.
 * @param buf Destination, at most buf.size() bytes are read.
 * @param[out] err Set to io_error if the stream fails.
 * @returns The number of bytes read, less than buf.size() only at EOF.
 */
auto read_chunk(std::fstream &file, std::span<char> buf,
                std::error_code &err) -> std::size_t;

/**
 * @brief Writes a chunk to a file and flushes it.
 * @param file The stream to write to.
 * @param buf The bytes to write.
 * @returns An error code set to io_error if the write fails.
 */
auto write_chunk(std::fstream &file,
                 std::span<const char> buf) -> std::error_code;

/**
 * @brief Closes a completed temporary file and moves it over its target.
 * @param file The stream that wrote tmp.
 * @param tmp The temporary file.
 * @param target The destination.
 * @returns An error code indicating success or failure.
 */
auto commit(std::fstream &file, const std::filesystem::path &tmp,
            const std::filesystem::path &target) -> std::error_code;
} // namespace tftpsrv::filesystem
#endif // TFTPSRV_FILESYSTEM_HPP
