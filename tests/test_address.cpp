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
// NOLINTBEGIN
#include "tftpsrv/detail/address.hpp"

#include <gtest/gtest.h>

#include <array>

#include <arpa/inet.h>

using namespace tftpsrv::detail;

static auto make_v4(const char *addr, unsigned short port)
    -> socket_address<sockaddr_in6>
{
  auto address = socket_address<sockaddr_in6>();
  auto *addr_v4 = reinterpret_cast<sockaddr_in *>(std::ranges::data(address));
  addr_v4->sin_family = AF_INET;
  addr_v4->sin_port = htons(port);
  addr_v4->sin_addr.s_addr = inet_addr(addr);

  // The same conversion the server applies to IPv4 peers.
  address = socket_address(
      reinterpret_cast<sockaddr_in *>(std::ranges::data(address)));
  return address;
}

static auto make_v6(const char *addr, unsigned short port)
    -> socket_address<sockaddr_in6>
{
  auto addr_v6 = socket_address<sockaddr_in6>();
  addr_v6->sin6_family = AF_INET6;
  addr_v6->sin6_port = htons(port);
  inet_pton(AF_INET6, addr, &addr_v6->sin6_addr);
  return addr_v6;
}

TEST(AddressTest, FormatsIPv4)
{
  auto buf = std::array<char, ADDRSTR_LEN>{};
  EXPECT_EQ(to_str(buf, make_v4("127.0.0.1", 8080)), "127.0.0.1:8080");
}

TEST(AddressTest, FormatsIPv6)
{
  auto buf = std::array<char, ADDRSTR_LEN>{};
  EXPECT_EQ(to_str(buf, make_v6("::1", 69)), "[::1]:69");
  EXPECT_EQ(to_str(buf, make_v6("fe80::1:2", 65535)), "[fe80::1:2]:65535");
}

TEST(AddressTest, SameEndpoint)
{
  EXPECT_TRUE(same_endpoint(make_v4("127.0.0.1", 1000),
                            make_v4("127.0.0.1", 1000)));
  EXPECT_FALSE(same_endpoint(make_v4("127.0.0.1", 1000),
                             make_v4("127.0.0.1", 1001)));
  EXPECT_FALSE(same_endpoint(make_v4("127.0.0.1", 1000),
                             make_v4("127.0.0.2", 1000)));
  EXPECT_TRUE(same_endpoint(make_v6("::1", 1000), make_v6("::1", 1000)));
  EXPECT_FALSE(same_endpoint(make_v6("::1", 1000), make_v6("::2", 1000)));
  EXPECT_FALSE(same_endpoint(make_v6("::1", 1000), make_v4("0.0.0.1", 1000)));
}
// NOLINTEND
