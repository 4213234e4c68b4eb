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
 * @file endian.hpp
 * @brief This file defines constexpr big-endian wire field helpers.
 */
#pragma once
#ifndef TFTPSRV_ENDIAN_HPP
#define TFTPSRV_ENDIAN_HPP
#include <cstddef>
#include <cstdint>
#include <span>
/** @brief Defines internal tftpsrv implementation details. */
namespace tftpsrv::detail {
// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)

/**
 * @brief Reads a big-endian 16-bit field.
 * @pre `buf` holds at least two bytes.
 * @param buf The bytes to read from.
 * @returns The field value in host byte order.
 */
constexpr auto load_u16(std::span<const std::byte> buf) noexcept
    -> std::uint16_t
{
  return static_cast<std::uint16_t>(
      (std::to_integer<std::uint16_t>(buf[0]) << 8) |
      std::to_integer<std::uint16_t>(buf[1]));
}

/**
 * @brief Appends a 16-bit value to a buffer in big-endian order.
 * @tparam Buffer A container of char supporting push_back.
 * @param buf The buffer to append to.
 * @param value The value in host byte order.
 */
template <typename Buffer>
constexpr auto store_u16(Buffer &buf, const std::uint16_t value) -> void
{
  buf.push_back(static_cast<char>(value >> 8));
  buf.push_back(static_cast<char>(value & 0xFF));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
} // namespace tftpsrv::detail
#endif // TFTPSRV_ENDIAN_HPP
