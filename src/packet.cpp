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
 * @file packet.cpp
 * @brief This file defines the TFTP wire codec.
 */
#include "tftpsrv/protocol/packet.hpp"
#include "tftpsrv/detail/endian.hpp"
#include "tftpsrv/error.hpp"

#include <cstring>
#include <string_view>
namespace tftpsrv {
namespace {
/**
 * @brief Extracts a NUL-terminated string from the front of buf.
 * @param[in,out] buf The remaining bytes, advanced past the terminator.
 * @param[out] str The string without its terminator.
 * @returns false if buf holds no terminator.
 */
auto take_string(std::span<const std::byte> &buf, std::string &str) -> bool
{
  const auto found = std::ranges::find(buf, std::byte{0});
  if (found == buf.end())
    return false;

  const auto len = static_cast<std::size_t>(found - buf.begin());
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  str.assign(reinterpret_cast<const char *>(buf.data()), len);
  buf = buf.subspan(len + 1);
  return true;
}

template <typename Request>
auto decode_request(std::span<const std::byte> buf,
                    std::error_code &err) -> packet
{
  auto req = Request{};
  if (!take_string(buf, req.filename) || req.filename.empty() ||
      !take_string(buf, req.mode) || req.mode.empty())
  {
    err = make_error_code(errc::malformed_packet);
    return {};
  }

  // Anything past the mode would be RFC 2347 options, which are not
  // negotiated.
  return req;
}

auto decode_data(std::span<const std::byte> buf,
                 std::error_code &err) -> packet
{
  if (buf.size() < sizeof(std::uint16_t))
  {
    err = make_error_code(errc::malformed_packet);
    return {};
  }

  auto payload = buf.subspan(sizeof(std::uint16_t));
  if (payload.size() > messages::DATALEN)
  {
    err = make_error_code(errc::malformed_packet);
    return {};
  }

  auto data = data_packet{.block_num = detail::load_u16(buf)};
  data.len = payload.size();
  std::memcpy(data.payload.data(), payload.data(), payload.size());
  return data;
}

auto decode_ack(std::span<const std::byte> buf, std::error_code &err) -> packet
{
  if (buf.size() < sizeof(std::uint16_t))
  {
    err = make_error_code(errc::malformed_packet);
    return {};
  }

  return ack_packet{.block_num = detail::load_u16(buf)};
}

auto decode_error(std::span<const std::byte> buf,
                  std::error_code &err) -> packet
{
  if (buf.size() < sizeof(std::uint16_t))
  {
    err = make_error_code(errc::malformed_packet);
    return {};
  }

  auto error = error_packet{.code = detail::load_u16(buf)};
  buf = buf.subspan(sizeof(std::uint16_t));
  if (!take_string(buf, error.message) || error.message.empty())
  {
    err = make_error_code(errc::malformed_packet);
    return {};
  }

  return error;
}

auto append(std::vector<char> &buf, std::string_view str) -> void
{
  buf.insert(buf.end(), str.begin(), str.end());
  buf.push_back('\0');
}

/** @brief Packet visitor that appends each variant's fields to a buffer. */
struct encoder {
  std::vector<char> &buf;

  auto operator()(const read_request &req) const -> void
  {
    append(buf, req.filename);
    append(buf, req.mode);
  }

  auto operator()(const write_request &req) const -> void
  {
    append(buf, req.filename);
    append(buf, req.mode);
  }

  auto operator()(const data_packet &data) const -> void
  {
    detail::store_u16(buf, data.block_num);
    const auto bytes = data.bytes();
    buf.insert(buf.end(), bytes.begin(), bytes.end());
  }

  auto operator()(const ack_packet &ack) const -> void
  {
    detail::store_u16(buf, ack.block_num);
  }

  auto operator()(const error_packet &error) const -> void
  {
    detail::store_u16(buf, error.code);
    append(buf, error.message);
  }
};
} // namespace

auto decode(std::span<const std::byte> buf, std::error_code &err) -> packet
{
  using enum messages::opcode_t;
  err.clear();

  if (buf.size() < messages::OPCODE_LEN)
  {
    err = make_error_code(errc::malformed_packet);
    return {};
  }

  const auto opc = detail::load_u16(buf);
  buf = buf.subspan(messages::OPCODE_LEN);
  switch (opc)
  {
    case RRQ:
      return decode_request<read_request>(buf, err);

    case WRQ:
      return decode_request<write_request>(buf, err);

    case DATA:
      return decode_data(buf, err);

    case ACK:
      return decode_ack(buf, err);

    case ERROR:
      return decode_error(buf, err);

    default:
      err = make_error_code(errc::unknown_opcode);
      return {};
  }
}

auto encode(const packet &pkt, std::vector<char> &buf) -> void
{
  buf.clear();
  buf.reserve(messages::DATAMSG_MAXLEN);
  detail::store_u16(buf, opcode(pkt));
  std::visit(encoder{buf}, pkt);
}
} // namespace tftpsrv
