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
 * @file address.hpp
 * @brief This file declares socket address helpers.
 */
#pragma once
#ifndef TFTPSRV_ADDRESS_HPP
#define TFTPSRV_ADDRESS_HPP
#include <net/cppnet.hpp>

#include <span>
#include <string_view>

#include <netinet/in.h>
/** @brief Defines internal tftpsrv implementation details. */
namespace tftpsrv::detail {
/** @brief Socket address type. */
template <typename T> using socket_address = ::io::socket::socket_address<T>;

/** @brief Additional buffer length for <PORT>,[],: and null.  */
static constexpr auto ADDR_BUFLEN = 9UL;
/** @brief Buffer size needed by to_str(). */
static constexpr auto ADDRSTR_LEN = INET6_ADDRSTRLEN + ADDR_BUFLEN;

/**
 * @brief Converts the socket address to a string inside buf.
 * @param buf At least ADDRSTR_LEN bytes of storage.
 * @param addr The address to print.
 * @returns A view into buf, "a.b.c.d:port" or "[v6]:port".
 */
[[nodiscard]] auto to_str(std::span<char> buf,
                          socket_address<sockaddr_in6> addr) noexcept
    -> std::string_view;

/**
 * @brief Compares the transport endpoints of two addresses.
 * @param lhs The first address.
 * @param rhs The second address.
 * @returns true if family, IP address and port all match.
 */
[[nodiscard]] auto same_endpoint(socket_address<sockaddr_in6> lhs,
                                 socket_address<sockaddr_in6> rhs) noexcept
    -> bool;
} // namespace tftpsrv::detail
#endif // TFTPSRV_ADDRESS_HPP
