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
 * @file packet.hpp
 * @brief This file declares the typed TFTP packets and their wire codec.
 */
#pragma once
#ifndef TFTPSRV_PACKET_HPP
#define TFTPSRV_PACKET_HPP
#include "tftp_protocol.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <system_error>
#include <variant>
#include <vector>
/** @brief TFTP server. */
namespace tftpsrv {
/** @brief An RRQ packet. */
struct read_request {
  /** @brief The requested file. */
  std::string filename;
  /** @brief The transfer mode. */
  std::string mode;

  auto operator==(const read_request &) const -> bool = default;
};

/** @brief A WRQ packet. */
struct write_request {
  /** @brief The file to create. */
  std::string filename;
  /** @brief The transfer mode. */
  std::string mode;

  auto operator==(const write_request &) const -> bool = default;
};

/** @brief A DATA packet. */
struct data_packet {
  /** @brief Block number (starts at 1). */
  std::uint16_t block_num = 0;
  /** @brief Payload storage, only the first `len` bytes are meaningful. */
  std::array<char, messages::DATALEN> payload{};
  /** @brief The payload length. */
  std::size_t len = 0;

  /** @brief The meaningful part of the payload. */
  [[nodiscard]] auto bytes() const noexcept -> std::span<const char>
  {
    return {payload.data(), len};
  }

  /** @brief A data packet with fewer than DATALEN bytes ends a transfer. */
  [[nodiscard]] auto last() const noexcept -> bool
  {
    return len < messages::DATALEN;
  }

  friend auto operator==(const data_packet &lhs,
                         const data_packet &rhs) noexcept -> bool
  {
    return lhs.block_num == rhs.block_num &&
           std::ranges::equal(lhs.bytes(), rhs.bytes());
  }
};

/** @brief An ACK packet. */
struct ack_packet {
  /** @brief The acknowledged block number. */
  std::uint16_t block_num = 0;

  auto operator==(const ack_packet &) const -> bool = default;
};

/** @brief An ERROR packet. */
struct error_packet {
  /** @brief One of messages::error_t. */
  std::uint16_t code = 0;
  /** @brief Human readable description. */
  std::string message;

  auto operator==(const error_packet &) const -> bool = default;
};

/** @brief Any TFTP packet. */
using packet = std::variant<read_request, write_request, data_packet,
                            ack_packet, error_packet>;

/**
 * @brief Decodes a datagram.
 * @param buf Exactly the bytes of one received datagram.
 * @param[out] err Cleared on success, errc::malformed_packet or
 * errc::unknown_opcode on failure.
 * @returns The decoded packet, unspecified if err is set.
 */
auto decode(std::span<const std::byte> buf, std::error_code &err) -> packet;

/**
 * @brief Encodes a packet into a buffer.
 * @param pkt The packet to encode.
 * @param[out] buf Replaced with the wire representation of pkt.
 */
auto encode(const packet &pkt, std::vector<char> &buf) -> void;

/**
 * @brief Encodes a packet.
 * @param pkt The packet to encode.
 * @returns The wire representation of pkt.
 */
inline auto encode(const packet &pkt) -> std::vector<char>
{
  auto buf = std::vector<char>();
  encode(pkt, buf);
  return buf;
}

/**
 * @brief Returns the wire opcode of a packet.
 * @param pkt The packet.
 * @returns One of messages::opcode_t.
 */
constexpr auto opcode(const packet &pkt) noexcept -> std::uint16_t
{
  return static_cast<std::uint16_t>(pkt.index() + messages::RRQ);
}
} // namespace tftpsrv
#endif // TFTPSRV_PACKET_HPP
