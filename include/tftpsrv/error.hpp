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
 * @file error.hpp
 * @brief This file declares the tftpsrv error category.
 */
#pragma once
#ifndef TFTPSRV_ERROR_HPP
#define TFTPSRV_ERROR_HPP
#include <cstdint>
#include <system_error>
/** @brief TFTP server. */
namespace tftpsrv {
/**
 * @brief Protocol level failure conditions.
 * @details Filesystem failures are reported with std::errc values instead.
 */
enum class errc : std::uint8_t {
  /** @brief The datagram violates the packet format. */
  malformed_packet = 1,
  /** @brief The datagram carries an opcode outside of RFC 1350. */
  unknown_opcode,
  /** @brief A valid packet arrived in a state that does not expect it. */
  unexpected_packet,
  /** @brief The peer sent an ERROR packet. */
  peer_aborted,
  /** @brief The peer stopped responding. */
  timed_out,
};

/**
 * @brief Returns the tftpsrv error category.
 * @returns A reference to the static category instance.
 */
auto category() noexcept -> const std::error_category &;

/**
 * @brief Makes an error code from a tftpsrv::errc.
 * @param err The error condition.
 * @returns An error code in the tftpsrv category.
 */
auto make_error_code(errc err) noexcept -> std::error_code;

/**
 * @brief Maps an error code onto the TFTP ERROR packet code sent to a peer.
 * @param err The error to map.
 * @returns One of messages::error_t.
 */
auto to_wire_error(const std::error_code &err) noexcept -> std::uint16_t;
} // namespace tftpsrv

template <> struct std::is_error_code_enum<tftpsrv::errc> : std::true_type {};
#endif // TFTPSRV_ERROR_HPP
