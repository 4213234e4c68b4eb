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
 * @file tftp_protocol.hpp
 * @brief This file declares the RFC 1350 protocol constants.
 */
#pragma once
#ifndef TFTPSRV_PROTOCOL_HPP
#define TFTPSRV_PROTOCOL_HPP
#include "tftpsrv/detail/endian.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
/** @brief TFTP server. */
namespace tftpsrv {
// NOLINTBEGIN(performance-enum-size)
/** @brief Protocol definitions shared by the codec, sessions and server. */
struct messages {
  /**
   * @brief Protocol defined operations (opcodes).
   * These are the valid TFTP operation codes as defined in RFC 1350.
   */
  enum opcode_t : std::uint16_t { RRQ = 1, WRQ, DATA, ACK, ERROR };

  /**
   * @brief Protocol defined error codes.
   * These are the standard TFTP error codes as defined in RFC 1350.
   */
  enum error_t : std::uint16_t {
    NOT_DEFINED = 0,
    FILE_NOT_FOUND,
    ACCESS_VIOLATION,
    DISK_FULL,
    ILLEGAL_OPERATION,
    UNKNOWN_TID,
    FILE_ALREADY_EXISTS,
    NO_SUCH_USER,
    // Errors below this point are all ALIASES to NOT_DEFINED.
    TIMED_OUT,
    UNSUPPORTED_MODE
  };

  /** @brief Size of the opcode field. */
  static constexpr auto OPCODE_LEN = sizeof(std::uint16_t);
  /** @brief Size of the opcode and block number (or error code) fields. */
  static constexpr auto HEADER_LEN = 2 * sizeof(std::uint16_t);
  /** @brief The maximum data payload size in bytes (512 bytes per RFC 1350). */
  static constexpr auto DATALEN = 512UL;
  /** @brief The maximum total size of a DATA message (header + payload). */
  static constexpr auto DATAMSG_MAXLEN = HEADER_LEN + DATALEN;
  /** @brief The only transfer mode that is served. */
  static constexpr auto OCTET = std::string_view("octet");
};
// NOLINTEND(performance-enum-size)

/**
 * @brief Advances a block number.
 * @param block_num The current block number.
 * @returns block_num + 1, wrapping 65535 to 0.
 */
constexpr auto increment(std::uint16_t block_num) noexcept -> std::uint16_t
{
  return static_cast<std::uint16_t>(block_num + 1);
}

/**
 * @brief Checks a request mode against "octet", ignoring case.
 * @param mode The mode string taken from an RRQ or WRQ.
 * @returns true if the mode is octet.
 */
constexpr auto is_octet(std::string_view mode) noexcept -> bool
{
  if (mode.size() != messages::OCTET.size())
    return false;

  for (std::size_t i = 0; i < mode.size(); ++i)
  {
    auto chr = mode[i];
    if (chr >= 'A' && chr <= 'Z')
      chr = static_cast<char>(chr - 'A' + 'a');

    if (chr != messages::OCTET[i])
      return false;
  }
  return true;
}

/** @brief Error messages. */
struct errors {
  // NOLINTBEGIN
  /**
   * @brief Constructs a tftp message from an error number and a string.
   * @tparam N The length of the string (including the null byte).
   * @param error The error code.
   * @param str The error message.
   * @returns A byte array containing the error message with all fields in
   * network byte order.
   */
  template <std::size_t N>
  static constexpr auto msg(const std::uint16_t error,
                            const char (&str)[N]) noexcept
  {
    auto buf = std::array<char, messages::HEADER_LEN + N>();
    buf[0] = 0;
    buf[1] = static_cast<char>(messages::ERROR);
    buf[2] = static_cast<char>(error >> 8);
    buf[3] = static_cast<char>(error & 0xFF);
    for (std::size_t i = 0; i < N; ++i)
      buf[messages::HEADER_LEN + i] = str[i];

    return buf;
  }
  // NOLINTEND

  /**
   * @brief Converts a TFTP error to a string.
   * @param error The TFTP error.
   * @returns A string_view containing the relevant error message.
   */
  static constexpr auto errstr(std::uint16_t error) noexcept -> std::string_view
  {
    using enum messages::error_t;
    switch (error)
    {
      case ACCESS_VIOLATION:
        return "Access violation.";

      case FILE_NOT_FOUND:
        return "File not found.";

      case DISK_FULL:
        return "Disk full.";

      case NO_SUCH_USER:
        return "No such user.";

      case FILE_ALREADY_EXISTS:
        return "File already exists.";

      case UNKNOWN_TID:
        return "Unknown TID.";

      case ILLEGAL_OPERATION:
        return "Illegal operation.";

      case TIMED_OUT:
        return "Timed out.";

      case UNSUPPORTED_MODE:
        return "Transfer mode not supported.";

      default:
        return "Not defined.";
    }
  }

  /**
   * @brief Creates a "Timed out" error packet.
   *
   * Sent to the peer when a session gives up after exhausting its
   * retransmissions.
   *
   * @return Const reference to a static buffer containing the error packet.
   */
  static auto timed_out() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(NOT_DEFINED, "Timed out.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /**
   * @brief Creates an "Access violation" error packet.
   * @return Const reference to a static buffer containing the error packet.
   */
  static auto access_violation() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(ACCESS_VIOLATION, "Access violation.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /**
   * @brief Creates a "File not found" error packet.
   * @return Const reference to a static buffer containing the error packet.
   */
  static auto file_not_found() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(FILE_NOT_FOUND, "File not found.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /**
   * @brief Creates a "Disk full" error packet.
   *
   * Sent when writing a received block to storage fails.
   *
   * @return Const reference to a static buffer containing the error packet.
   */
  static auto disk_full() noexcept -> decltype(auto) // GCOVR_EXCL_LINE
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(DISK_FULL, "Disk full.");
    return static_cast<const decltype(buf) &>(buf); // GCOVR_EXCL_LINE
  }

  /**
   * @brief Creates an "Illegal operation" error packet.
   *
   * Sent for undecodable datagrams and for packets that are not valid in the
   * receiver's current state.
   *
   * @return Const reference to a static buffer containing the error packet.
   */
  static auto illegal_operation() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(ILLEGAL_OPERATION, "Illegal operation.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /** @brief Creates a "Transfer mode not supported" error packet. */
  static auto unsupported_mode() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf =
        msg(NOT_DEFINED, "Transfer mode not supported.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /** @brief Creates a "Not defined" error packet. */
  static auto not_defined() noexcept -> decltype(auto)
  {
    using enum messages::error_t;
    static constexpr auto buf = msg(NOT_DEFINED, "Not defined.");
    return static_cast<const decltype(buf) &>(buf);
  }

  /**
   * @brief Selects the prebuilt packet for an error code.
   * @param error One of messages::error_t.
   * @returns A view of a buffer with static storage duration.
   */
  static auto packet(std::uint16_t error) noexcept -> std::span<const char>
  {
    using enum messages::error_t;
    switch (error)
    {
      case ACCESS_VIOLATION:
        return access_violation();

      case FILE_NOT_FOUND:
        return file_not_found();

      case DISK_FULL:
        return disk_full();

      case ILLEGAL_OPERATION:
        return illegal_operation();

      case TIMED_OUT:
        return timed_out();

      case UNSUPPORTED_MODE:
        return unsupported_mode();

      default:
        return not_defined();
    }
  }
};

} // namespace tftpsrv
#endif // TFTPSRV_PROTOCOL_HPP
