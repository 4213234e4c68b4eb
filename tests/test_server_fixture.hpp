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
#pragma once
#ifndef TFTPSRV_TEST_SERVER_FIXTURE_HPP
#define TFTPSRV_TEST_SERVER_FIXTURE_HPP
#include "tftpsrv/config.hpp"
#include "tftpsrv/protocol/packet.hpp"
#include "tftpsrv/protocol/tftp_protocol.hpp"
#include "tftpsrv/tftp_server.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>

using namespace tftpsrv;

static inline auto test_counter = std::atomic<std::uint16_t>();
class TftpServerTests : public ::testing::Test {
protected:
  using tftp_server = net::service::context_thread<server>;
  using socket_handle = io::socket::socket_handle;
  template <typename T> using socket_address = io::socket::socket_address<T>;
  using peer_address = socket_address<sockaddr_in6>;

  auto SetUp() noexcept -> void override
  {
    using enum net::service::async_context::context_states;

    addr_v4->sin_family = AF_INET;
    addr_v4->sin_port = htons(8080);
    addr_v4->sin_addr.s_addr = inet_addr("127.0.0.1");

    test_file = (std::filesystem::temp_directory_path() / "tftpsrv_test.")
                    .concat(std::format("{:05d}", test_counter++));
    std::filesystem::remove(test_file);

    server_ = std::make_unique<tftp_server>();
    server_->start(addr_v4);
    server_->state.wait(PENDING);
    ASSERT_EQ(server_->state, STARTED);
  }

  auto TearDown() noexcept -> void override
  {
    using enum net::service::async_context::context_states;

    server_->signal(server_->terminate);
    server_->state.wait(STARTED);
    ASSERT_EQ(server_->state, STOPPED);
    server_.reset();

    std::filesystem::remove(test_file);
  }

  /** @brief How long a test waits before deciding nothing is coming. */
  static auto quiet_period() -> std::chrono::milliseconds
  {
    return 3 * config::timeout();
  }

  static auto make_data(std::size_t size) -> std::vector<char>
  {
    auto gen = std::mt19937(static_cast<std::mt19937::result_type>(size));
    auto dist = std::uniform_int_distribution<int>(0, 255);
    auto data = std::vector<char>(size);
    std::ranges::generate(data, [&] { return static_cast<char>(dist(gen)); });
    return data;
  }

  static auto write_file(const std::filesystem::path &path,
                         std::size_t size) -> std::vector<char>
  {
    auto data = make_data(size);
    auto outf = std::ofstream(path, std::ios::binary);
    outf.write(data.data(), static_cast<std::streamsize>(data.size()));
    return data;
  }

  static auto read_file(const std::filesystem::path &path) -> std::vector<char>
  {
    auto inf = std::ifstream(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(inf),
            std::istreambuf_iterator<char>()};
  }

  /** @brief Sends a packet to the listening port. */
  auto send_request(socket_handle &sock, const packet &pkt) -> void
  {
    send_raw(sock, encode(pkt));
  }

  /** @brief Sends raw bytes to the listening port. */
  auto send_raw(socket_handle &sock, std::vector<char> buf) -> void
  {
    using namespace io::socket;
    auto len = io::sendmsg(
        sock, socket_message{.address = {addr_v4}, .buffers = buf}, 0);
    ASSERT_EQ(len, buf.size());
  }

  /** @brief Sends raw bytes to a session. */
  static auto send_to(socket_handle &sock, peer_address address,
                      std::vector<char> buf) -> void
  {
    using namespace io::socket;
    auto len = io::sendmsg(
        sock,
        socket_message<sockaddr_in6>{.address = {address}, .buffers = buf}, 0);
    ASSERT_EQ(len, buf.size());
  }

  /** @brief Sends a packet to a session. */
  static auto send_to(socket_handle &sock, peer_address address,
                      const packet &pkt) -> void
  {
    send_to(sock, address, encode(pkt));
  }

  /**
   * @brief Waits for one datagram.
   * @returns The datagram length, or -1 if nothing arrived in time.
   */
  static auto receive(socket_handle &sock, std::vector<char> &buf,
                      peer_address &from,
                      std::chrono::milliseconds timeout =
                          std::chrono::milliseconds(5000)) -> long
  {
    using namespace io::socket;
    auto pfd = pollfd{.fd = static_cast<native_socket_type>(sock),
                      .events = POLLIN,
                      .revents = 0};
    if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0)
      return -1;

    buf.resize(messages::DATAMSG_MAXLEN);
    auto sockmsg = socket_message{
        .address = {socket_address<sockaddr_in6>()}, .buffers = buf};
    auto len = io::recvmsg(sock, sockmsg, MSG_DONTWAIT);
    if (len < 0)
      return -1;

    from = *sockmsg.address;
    buf.resize(static_cast<std::size_t>(len));
    return len;
  }

  /** @brief Waits for one datagram and decodes it. */
  static auto receive_packet(socket_handle &sock, peer_address &from,
                             std::chrono::milliseconds timeout =
                                 std::chrono::milliseconds(5000))
      -> std::optional<packet>
  {
    auto buf = std::vector<char>();
    if (receive(sock, buf, from, timeout) < 0)
      return std::nullopt;

    auto err = std::error_code();
    auto pkt = decode(std::as_bytes(std::span(buf)), err);
    if (err)
      return std::nullopt;

    return pkt;
  }

  /**
   * @brief Reads a whole file through the server.
   * @returns The bytes received, nullopt if the transfer failed.
   */
  auto read_transfer(socket_handle &sock, const std::filesystem::path &path)
      -> std::optional<std::vector<char>>
  {
    auto received = std::vector<char>();
    send_request(sock, read_request{.filename = path.string(),
                                    .mode = std::string(messages::OCTET)});

    auto from = peer_address();
    std::uint16_t expected = 1;
    for (;;)
    {
      auto pkt = receive_packet(sock, from);
      if (!pkt)
        return std::nullopt;

      const auto *data = std::get_if<data_packet>(&*pkt);
      if (!data)
        return std::nullopt;

      // Skip retransmissions of the block already acknowledged.
      if (data->block_num != expected)
        continue;

      std::ranges::copy(data->bytes(), std::back_inserter(received));
      send_to(sock, from, ack_packet{.block_num = data->block_num});
      if (data->last())
        return received;

      expected = increment(expected);
    }
  }

  io::socket::socket_address<sockaddr_in> addr_v4;
  std::unique_ptr<tftp_server> server_;
  std::filesystem::path test_file;
};

class TftpServerTransferTests
    : public TftpServerTests,
      public ::testing::WithParamInterface<std::size_t> {};
#endif // TFTPSRV_TEST_SERVER_FIXTURE_HPP
// NOLINTEND
