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
 * @file config.hpp
 * @brief This file declares the process-wide server configuration.
 * @details Every value is read from the environment the first time it is
 * requested and cached for the lifetime of the process. The command line
 * front end exports its options before the server starts.
 */
#pragma once
#ifndef TFTPSRV_CONFIG_HPP
#define TFTPSRV_CONFIG_HPP
#include <chrono>
#include <filesystem>
#include <string_view>
/** @brief Process configuration. */
namespace tftpsrv::config {
/** @brief Environment variable naming the directory files are served from. */
constexpr auto ROOT_ENV = "TFTPSRV_ROOT";
/** @brief Environment variable holding the per-packet timeout (ms). */
constexpr auto TIMEOUT_ENV = "TFTPSRV_TIMEOUT_MS";
/** @brief Environment variable holding the retransmission limit. */
constexpr auto RETRIES_ENV = "TFTPSRV_RETRIES";

/** @brief Default per-packet timeout. */
constexpr auto DEFAULT_TIMEOUT = std::chrono::milliseconds(3000);
/** @brief Default retransmission limit. */
constexpr auto DEFAULT_RETRIES = 5U;

/**
 * @brief Returns the directory that request filenames resolve against.
 * @return Const reference to the root path, "." unless TFTPSRV_ROOT is set.
 */
auto root_directory() noexcept -> const std::filesystem::path &;

/**
 * @brief Returns how long a session waits for each reply.
 * @return TFTPSRV_TIMEOUT_MS if it parses to a positive value, the default
 * otherwise.
 */
auto timeout() noexcept -> std::chrono::milliseconds;

/**
 * @brief Returns how many times a session retransmits before giving up.
 * @return TFTPSRV_RETRIES if it parses, the default otherwise.
 */
auto max_retries() noexcept -> unsigned;

/**
 * @brief Resolves a requested filename against the root directory.
 * @param filename The filename from an RRQ or WRQ.
 * @return The path to open. Absolute filenames are returned unchanged.
 */
auto resolve(std::string_view filename) -> std::filesystem::path;
} // namespace tftpsrv::config
#endif // TFTPSRV_CONFIG_HPP
