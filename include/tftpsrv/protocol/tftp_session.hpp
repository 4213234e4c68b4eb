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
 * @file tftp_session.hpp
 * @brief This file declares a TFTP transfer session.
 */
#pragma once
#ifndef TFTPSRV_SESSION_HPP
#define TFTPSRV_SESSION_HPP
#include "packet.hpp"
#include "tftpsrv/config.hpp"

#include <net/cppnet.hpp>
#include <net/timers/timers.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>
namespace tftpsrv {
/** @brief TFTP max buffer allocation. */
static constexpr auto BUFSIZE = messages::DATAMSG_MAXLEN;
/** @brief The service type to use. */
template <typename UDPStreamHandler>
using udp_base = net::service::async_udp_service<UDPStreamHandler, BUFSIZE>;

/**
 * @brief One transfer with one client.
 *
 * A session runs as the service of its own net::service::context_thread.
 * It owns a socket with a fresh ephemeral port, which is the server's
 * transfer ID for the peer. Every packet it sends arms a retransmission
 * timer, and the context is terminated when the transfer ends.
 */
class session : public udp_base<session> {
public:
  /** @brief The base class. */
  using Base = udp_base<session>;
  /** @brief the session duration. */
  using duration = std::chrono::milliseconds;
  /** @brief The socket message type. */
  using socket_message = io::socket::socket_message<sockaddr_in6>;
  /** @brief The session timer. */
  using timer_id = net::timers::timer_id;
  /** @brief The invalid timer value. */
  static constexpr auto INVALID_TIMER = net::timers::INVALID_TIMER;

  /** @brief Retransmission settings. */
  struct options_t {
    /** @brief How long to wait for each reply. */
    duration timeout{config::DEFAULT_TIMEOUT};
    /** @brief How many retransmissions to attempt before giving up. */
    unsigned max_retries{config::DEFAULT_RETRIES};
  };

  /** @brief The session state. */
  struct state_t {
    /** @brief The requested filepath. */
    std::filesystem::path target;
    /** @brief The temporary filepath (write transfers only). */
    std::filesystem::path tmp;
    /** @brief The fstream associated with the operation. */
    std::shared_ptr<std::fstream> file;
    /** @brief The last packet sent, kept for retransmission. */
    std::vector<char> buffer;
    /**
     * @brief The current protocol block number.
     *
     * A new transfer starts from 0, so the first DATA of a read is block 1
     * and a write is accepted with ACK(0).
     */
    std::uint16_t block_num = 0;
    /** @brief The file operation (RRQ or WRQ). */
    std::uint16_t opc = 0;
    /** @brief Set once the final DATA has been sent (RRQ). */
    bool last_block = false;
    /** @brief Set once the transfer has completed successfully. */
    bool complete = false;
  };

  /**
   * @brief Creates a session for a peer.
   * @param peer The client's address.
   * @param state The initial state, with opc, target and file set.
   * @param options Retransmission settings.
   */
  session(socket_address<sockaddr_in6> peer, state_t state,
          options_t options);

  session(const session &) = delete;
  session(session &&) = delete;
  auto operator=(const session &) -> session & = delete;
  auto operator=(session &&) -> session & = delete;

  /** @brief Releases the file and discards any uncommitted upload. */
  ~session();

  /**
   * @brief Opens the session socket and sends the first packet.
   * @param ctx The session's own asynchronous context.
   * @returns An empty error code. Transfer errors are reported to the peer.
   */
  auto start(async_context &ctx) -> std::error_code;

  /**
   * @brief Ends the transfer early when the context is terminated.
   * @param signum The signal raised on the context.
   */
  auto signal_handler(int signum) noexcept -> void;

  /**
   * @brief Services a datagram read from the session socket.
   * @param ctx The session's asynchronous context.
   * @param socket The session socket.
   * @param rctx The read context that manages the read buffer lifetime.
   * @param buf The bytes that were read from the socket.
   */
  auto operator()(async_context &ctx, const socket_dialog &socket,
                  const std::shared_ptr<read_context> &rctx,
                  std::span<const std::byte> buf) -> void;

private:
  /** @brief The client's address. */
  socket_address<sockaddr_in6> peer_;
  /** @brief Retransmission settings. */
  options_t options_;
  /** @brief The session state. */
  state_t state_;
  /** @brief Printable peer address for logging. */
  std::string addrstr_;
  /** @brief The retransmission timer. */
  timer_id timer_{INVALID_TIMER};
  /** @brief The context running this session. */
  async_context *ctx_ = nullptr;
  /** @brief The session socket, once opened. */
  std::optional<socket_dialog> socket_;
  /** @brief Set once the session has finished. */
  bool stopped_ = false;

  /** @brief Handles a packet received during a read transfer. */
  auto on_ack(async_context &ctx, const socket_dialog &socket,
              const packet &pkt) -> std::error_code;

  /** @brief Handles a packet received during a write transfer. */
  auto on_data(async_context &ctx, const socket_dialog &socket,
               const packet &pkt) -> std::error_code;

  /** @brief Reads and encodes the next DATA block into the buffer. */
  auto next_block() -> std::error_code;

  /** @brief Sends the buffer to the peer. */
  auto send(async_context &ctx, const socket_dialog &socket) -> void;

  /**
   * @brief Sends the buffer and restarts the retransmission timer.
   *
   * Only new packets come through here. Repeats of the last packet do not
   * move the timer.
   */
  auto transmit(async_context &ctx, const socket_dialog &socket) -> void;

  /**
   * @brief Reports the outcome, closes the socket and stops the context.
   * @param ctx The session's asynchronous context.
   * @param socket The session socket.
   * @param err The outcome of the transfer.
   */
  auto finish(async_context &ctx, const socket_dialog &socket,
              std::error_code err) -> void;

  /** @brief Closes the file and deletes any uncommitted upload. */
  auto cleanup() noexcept -> void;

  /** @brief Returns "RRQ" or "WRQ" for log messages. */
  [[nodiscard]] auto tag() const noexcept -> const char *;
};

} // namespace tftpsrv
#endif // TFTPSRV_SESSION_HPP
