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
 * @file tftp_server.cpp
 * @brief This file defines the TFTP server.
 */
#include "tftpsrv/tftp_server.hpp"
#include "tftpsrv/config.hpp"
#include "tftpsrv/detail/address.hpp"
#include "tftpsrv/error.hpp"
#include "tftpsrv/filesystem.hpp"
#include "tftpsrv/protocol/tftp_protocol.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <memory>

#include <netinet/in.h>
#include <sys/socket.h>
namespace tftpsrv {
auto server::error(async_context &ctx, const socket_dialog &socket,
                   socket_address<sockaddr_in6> address,
                   std::uint16_t error) -> void
{
  using namespace stdexec;
  using enum messages::error_t;

  auto msg = socket_message{.address = {address}};
  switch (error)
  {
    case ACCESS_VIOLATION:
      msg.buffers = errors::access_violation();
      break;

    case FILE_NOT_FOUND:
      msg.buffers = errors::file_not_found();
      break;

    case DISK_FULL:                      // GCOVR_EXCL_LINE
      msg.buffers = errors::disk_full(); // GCOVR_EXCL_LINE
      break;                             // GCOVR_EXCL_LINE

    case ILLEGAL_OPERATION:
      msg.buffers = errors::illegal_operation();
      break;

    case UNSUPPORTED_MODE:
      msg.buffers = errors::unsupported_mode();
      break;

    default:
      msg.buffers = errors::not_defined();
      break;
  }

  sender auto sendmsg = io::sendmsg(socket, msg, 0) |
                        then([](auto &&len) {}) |
                        upon_error([](auto &&error) {}); // GCOVR_EXCL_LINE
  ctx.scope.spawn(std::move(sendmsg));
}

auto server::request(async_context &ctx, const socket_dialog &socket,
                     socket_address<sockaddr_in6> address, std::uint16_t opc,
                     std::string_view filename, std::string_view mode) -> void
{
  using enum messages::opcode_t;
  using enum messages::error_t;
  auto addrbuf = std::array<char, detail::ADDRSTR_LEN>{};

  const auto *tag = (opc == RRQ) ? "RRQ" : "WRQ";
  auto addrstr = detail::to_str(addrbuf, address);
  spdlog::info("{}:{}:New {} for {}.", tag, addrstr, tag, filename);

  if (!is_octet(mode))
  {
    spdlog::error("{}:{}:{}", tag, addrstr, errors::errstr(UNSUPPORTED_MODE));
    return error(ctx, socket, address, UNSUPPORTED_MODE);
  }

  auto state = session::state_t{.target = config::resolve(filename)};
  state.opc = opc;

  auto err = std::error_code();
  state.file = (opc == RRQ)
                   ? filesystem::open_read(state.target, err)
                   : filesystem::open_write(state.target, state.tmp, err);
  if (!state.file)
  {
    auto code = to_wire_error(err);
    spdlog::error("{}:{}:{}", tag, addrstr, errors::errstr(code));
    return error(ctx, socket, address, code);
  }

  err = launch(address, std::move(state));
  if (err)
  {
    spdlog::error("{}:{}:Unable to start session: {}", tag, addrstr,
                  err.message());
    return error(ctx, socket, address, NOT_DEFINED);
  }
}

server::~server()
{
  for (auto &thread : sessions_)
    thread.signal(thread.terminate);
}

auto server::launch(socket_address<sockaddr_in6> address,
                    session::state_t state) -> std::error_code
{
  auto options = session::options_t{.timeout = config::timeout(),
                                    .max_retries = config::max_retries()};

  auto &thread = sessions_.emplace_back();
  try
  {
    thread.start(address, std::move(state), options);
  }
  catch (const std::system_error &exc)
  {
    sessions_.pop_back();
    return exc.code();
  }

  return {};
}

auto server::reap() -> void
{
  using enum net::service::async_context::context_states;
  std::erase_if(sessions_, [](const session_thread &thread) {
    return thread.state == STOPPED;
  });
}

auto server::operator()(async_context &ctx, const socket_dialog &socket,
                        const std::shared_ptr<read_context> &rctx,
                        std::span<const std::byte> buf) -> void
{
  using enum messages::error_t;
  using namespace io::socket;
  if (!rctx)
    return;

  auto address = *rctx->msg.address;
  if (address->sin6_family == AF_INET)
  {
    address = socket_address(
        reinterpret_cast<sockaddr_in *>(std::ranges::data(address)));
  }

  reap();

  auto err = std::error_code();
  auto pkt = decode(buf, err);
  if (!err && (rctx->msg.flags & MSG_TRUNC))
    err = make_error_code(errc::malformed_packet);

  if (err)
  {
    auto addrbuf = std::array<char, detail::ADDRSTR_LEN>{};
    spdlog::warn("{}:{}", detail::to_str(addrbuf, address), err.message());
    error(ctx, socket, address, ILLEGAL_OPERATION);
  }
  else if (const auto *rrq = std::get_if<read_request>(&pkt))
  {
    request(ctx, socket, address, messages::RRQ, rrq->filename, rrq->mode);
  }
  else if (const auto *wrq = std::get_if<write_request>(&pkt))
  {
    request(ctx, socket, address, messages::WRQ, wrq->filename, wrq->mode);
  }
  else
  {
    auto addrbuf = std::array<char, detail::ADDRSTR_LEN>{};
    spdlog::warn("{}:Opcode {} is not a request.",
                 detail::to_str(addrbuf, address), opcode(pkt));
    error(ctx, socket, address, ILLEGAL_OPERATION);
  }

  reader(ctx, socket, rctx);
}
} // namespace tftpsrv
