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
 * @file tftp_server.hpp
 * @brief This file declares the TFTP server.
 */
#pragma once
#ifndef TFTPSRV_SERVER_HPP
#define TFTPSRV_SERVER_HPP
#include "protocol/packet.hpp"
#include "protocol/tftp_session.hpp"

#include <net/cppnet.hpp>

#include <list>
#include <string_view>
#include <system_error>
/** @brief TFTP server. */
namespace tftpsrv {
/**
 * @brief A TFTP server.
 * @details The server listens on the well-known port and accepts RRQ and
 * WRQ packets. Every accepted request is handed to a session that runs in
 * its own context_thread with its own socket, so the server keeps no
 * per-transfer state once a session has been launched.
 */
class server : public udp_base<server> {
public:
  /** @brief The base class. */
  using Base = udp_base<server>;
  /** @brief The socket message type. */
  using socket_message = io::socket::socket_message<sockaddr_in6>;

  /** @brief The thread and event loop that run one session. */
  using session_thread = net::service::context_thread<session>;

  /**
   * @brief Constructs a TFTP server on the socket address.
   * @tparam T The type of the socket_address.
   * @param address The local IP address to bind to.
   */
  template <typename T>
  explicit server(socket_address<T> address) noexcept : Base(address)
  {}

  server(const server &) = delete;
  server(server &&) = delete;
  auto operator=(const server &) -> server & = delete;
  auto operator=(server &&) -> server & = delete;

  /** @brief Terminates the sessions that are still running. */
  ~server();

  /**
   * @brief Dispatches an initial request to a new session.
   * @param ctx The asynchronous context of the message.
   * @param socket The listening socket that the message was read from.
   * @param rctx The read context that manages the read buffer lifetime.
   * @param buf The bytes that were read from the socket.
   */
  auto operator()(async_context &ctx, const socket_dialog &socket,
                  const std::shared_ptr<read_context> &rctx,
                  std::span<const std::byte> buf) -> void;

private:
  /** @brief Live sessions. */
  std::list<session_thread> sessions_;

  /**
   * @brief Sends an error notice to a client.
   * @param ctx The asynchronous context of the message.
   * @param socket The listening socket.
   * @param address The client address.
   * @param error The TFTP error code to send.
   */
  static auto error(async_context &ctx, const socket_dialog &socket,
                    socket_address<sockaddr_in6> address,
                    std::uint16_t error) -> void;

  /**
   * @brief Services a read or write request.
   * @param ctx The asynchronous context of the message.
   * @param socket The listening socket.
   * @param address The client address.
   * @param opc RRQ or WRQ.
   * @param filename The requested filename.
   * @param mode The requested transfer mode.
   */
  auto request(async_context &ctx, const socket_dialog &socket,
               socket_address<sockaddr_in6> address, std::uint16_t opc,
               std::string_view filename, std::string_view mode) -> void;

  /**
   * @brief Starts a session in a new context_thread.
   * @param address The client address.
   * @param state The initial session state.
   * @returns An error if the session's thread cannot be created.
   */
  auto launch(socket_address<sockaddr_in6> address,
              session::state_t state) -> std::error_code;

  /** @brief Removes the sessions whose contexts have stopped. */
  auto reap() -> void;
};
} // namespace tftpsrv
#endif // TFTPSRV_SERVER_HPP
