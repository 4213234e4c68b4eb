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
 * @file address.cpp
 * @brief This file defines socket address helpers.
 */
#include "tftpsrv/detail/address.hpp"

#include <algorithm>
#include <cassert>
#include <charconv>
#include <cstring>

#include <arpa/inet.h>
namespace tftpsrv::detail {
/** @brief Bounds checked implementation of strlen. */
[[nodiscard]] static constexpr auto
strnlen(const char *str, std::size_t maxlen) noexcept -> std::size_t
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto *found = std::find(str, str + maxlen, '\0');
  return found - str;
}

auto to_str(std::span<char> buf, socket_address<sockaddr_in6> addr) noexcept
    -> std::string_view
{
  assert(buf.size() >= ADDRSTR_LEN &&
         "Buffer must be large enough to print an IPv6 address and a port "
         "number.");

  std::memset(buf.data(), 0, buf.size());
  unsigned short port = 0;
  std::size_t len = 0;

  if (addr->sin6_family == AF_INET)
  {
    const auto *addr_v4 =
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<sockaddr_in *>(std::ranges::data(addr));
    inet_ntop(AF_INET, &addr_v4->sin_addr, buf.data(), buf.size());
    port = ntohs(addr_v4->sin_port);
    len = strnlen(buf.data(), buf.size());
  }
  else
  {
    buf[0] = '[';
    inet_ntop(AF_INET6, &addr->sin6_addr, buf.data() + 1, buf.size() - 1);
    port = ntohs(addr->sin6_port);
    len = strnlen(buf.data(), buf.size());
    buf[len++] = ']';
  }

  buf[len++] = ':';
  auto [end, err] =
      std::to_chars(buf.data() + len, buf.data() + buf.size(), port);
  return {buf.data(), static_cast<std::size_t>(end - buf.data())};
}

auto same_endpoint(socket_address<sockaddr_in6> lhs,
                   socket_address<sockaddr_in6> rhs) noexcept -> bool
{
  if (lhs->sin6_family != rhs->sin6_family)
    return false;

  if (lhs->sin6_family == AF_INET)
  {
    // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *lhs_v4 =
        reinterpret_cast<sockaddr_in *>(std::ranges::data(lhs));
    const auto *rhs_v4 =
        reinterpret_cast<sockaddr_in *>(std::ranges::data(rhs));
    // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
    return lhs_v4->sin_port == rhs_v4->sin_port &&
           lhs_v4->sin_addr.s_addr == rhs_v4->sin_addr.s_addr;
  }

  return lhs->sin6_port == rhs->sin6_port &&
         std::memcmp(&lhs->sin6_addr, &rhs->sin6_addr,
                     sizeof(in6_addr)) == 0;
}
} // namespace tftpsrv::detail
