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
 * @file error.cpp
 * @brief This file defines the tftpsrv error category.
 */
#include "tftpsrv/error.hpp"
#include "tftpsrv/protocol/tftp_protocol.hpp"

#include <string>
namespace tftpsrv {
namespace {
struct category_impl : public std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char * override
  {
    return "tftpsrv";
  }

  [[nodiscard]] auto message(int err) const -> std::string override
  {
    switch (static_cast<errc>(err))
    {
      case errc::malformed_packet:
        return "Malformed packet.";

      case errc::unknown_opcode:
        return "Unknown opcode.";

      case errc::unexpected_packet:
        return "Unexpected packet.";

      case errc::peer_aborted:
        return "Transfer aborted by peer.";

      case errc::timed_out:
        return "Timed out.";

      default:
        return "Unknown error.";
    }
  }
};
} // namespace

auto category() noexcept -> const std::error_category &
{
  static const auto instance = category_impl{};
  return instance;
}

auto make_error_code(errc err) noexcept -> std::error_code
{
  return {static_cast<int>(err), category()};
}

auto to_wire_error(const std::error_code &err) noexcept -> std::uint16_t
{
  using enum messages::error_t;

  if (err.category() == category())
  {
    switch (static_cast<errc>(err.value()))
    {
      case errc::malformed_packet:
      case errc::unknown_opcode:
      case errc::unexpected_packet:
        return ILLEGAL_OPERATION;

      case errc::timed_out:
        return TIMED_OUT;

      default:
        return NOT_DEFINED;
    }
  }

  if (err == std::errc::no_such_file_or_directory)
    return FILE_NOT_FOUND;

  if (err == std::errc::permission_denied ||
      err == std::errc::operation_not_permitted ||
      err == std::errc::is_a_directory)
  {
    return ACCESS_VIOLATION;
  }

  if (err == std::errc::no_space_on_device || err == std::errc::io_error)
    return DISK_FULL;

  return NOT_DEFINED;
}
} // namespace tftpsrv
