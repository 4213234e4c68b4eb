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
 * @file tftp_session.cpp
 * @brief This file defines a TFTP transfer session.
 */
#include "tftpsrv/protocol/tftp_session.hpp"
#include "tftpsrv/detail/address.hpp"
#include "tftpsrv/error.hpp"
#include "tftpsrv/filesystem.hpp"

#include <spdlog/spdlog.h>

#include <array>

#include <netinet/in.h>
#include <sys/socket.h>
namespace tftpsrv {

session::session(socket_address<sockaddr_in6> peer, state_t state,
                 options_t options)
    : Base(peer), peer_(peer), options_(options), state_(std::move(state))
{
  auto addrbuf = std::array<char, detail::ADDRSTR_LEN>{};
  addrstr_ = detail::to_str(addrbuf, peer_);
}

session::~session() { cleanup(); }

auto session::cleanup() noexcept -> void
{
  auto err = std::error_code();

  // Close the file if it is open.
  state_.file.reset();

  // Delete any temporary files.
  if (!state_.tmp.empty() && !std::filesystem::remove(state_.tmp, err) &&
      err) [[unlikely]]
  {
    spdlog::warn(                                            // GCOVR_EXCL_LINE
        "Failed to delete temporary file {} with error: {}", // GCOVR_EXCL_LINE
        state_.tmp.c_str(), err.message());                  // GCOVR_EXCL_LINE
  }
  state_.tmp.clear();
}

auto session::tag() const noexcept -> const char *
{
  return state_.opc == messages::RRQ ? "RRQ" : "WRQ";
}

auto session::start(async_context &ctx) -> std::error_code
{
  ctx_ = &ctx;
  socket_ = ctx.poller.emplace(peer_->sin6_family, SOCK_DGRAM, 0);
  const auto &socket = *socket_;

  auto err = std::error_code();
  if (state_.opc == messages::RRQ)
    err = next_block();
  else // A WRQ is accepted by acknowledging the starting block.
    encode(ack_packet{.block_num = state_.block_num}, state_.buffer);

  if (err)
  {
    finish(ctx, socket, err);
    return {};
  }

  transmit(ctx, socket);
  reader(ctx, socket, std::make_shared<read_context>());
  return {};
}

auto session::signal_handler(int signum) noexcept -> void
{
  if (signum != async_context::terminate || stopped_ || !ctx_ || !socket_)
    return;

  finish(*ctx_, *socket_, std::make_error_code(std::errc::operation_canceled));
}

auto session::operator()(async_context &ctx, const socket_dialog &socket,
                         const std::shared_ptr<read_context> &rctx,
                         std::span<const std::byte> buf) -> void
{
  using namespace io::socket;
  if (!rctx || stopped_)
    return;

  auto address = *rctx->msg.address;
  if (address->sin6_family == AF_INET)
  {
    address = socket_address(
        reinterpret_cast<sockaddr_in *>(std::ranges::data(address)));
  }

  // Datagrams from any other endpoint are not part of this transfer.
  if (!detail::same_endpoint(address, peer_))
  {
    auto addrbuf = std::array<char, detail::ADDRSTR_LEN>{};
    spdlog::debug("{}:{}:Ignoring datagram from {}.", tag(), addrstr_,
                  detail::to_str(addrbuf, address));
    return reader(ctx, socket, rctx);
  }

  auto err = std::error_code();
  auto pkt = decode(buf, err);
  if (!err && (rctx->msg.flags & MSG_TRUNC))
    err = make_error_code(errc::malformed_packet);

  if (err)
    return finish(ctx, socket, err);

  if (const auto *error = std::get_if<error_packet>(&pkt))
  {
    spdlog::warn("{}:{}:Peer error {}: {}", tag(), addrstr_, error->code,
                 error->message);
    return finish(ctx, socket, make_error_code(errc::peer_aborted));
  }

  err = (state_.opc == messages::RRQ) ? on_ack(ctx, socket, pkt)
                                      : on_data(ctx, socket, pkt);
  if (err || state_.complete)
    return finish(ctx, socket, err);

  reader(ctx, socket, rctx);
}

auto session::next_block() -> std::error_code
{
  auto data = data_packet{.block_num = increment(state_.block_num)};

  auto err = std::error_code();
  data.len = filesystem::read_chunk(*state_.file, data.payload, err);
  if (err) [[unlikely]]
    return err; // GCOVR_EXCL_LINE

  state_.block_num = data.block_num;
  state_.last_block = data.last();
  encode(data, state_.buffer);
  return {};
}

auto session::on_ack(async_context &ctx, const socket_dialog &socket,
                     const packet &pkt) -> std::error_code
{
  const auto *ack = std::get_if<ack_packet>(&pkt);
  if (!ack)
    return make_error_code(errc::unexpected_packet);

  if (ack->block_num != state_.block_num)
  {
    // A repeated ACK of the previous block is answered by nothing,
    // retransmitting here would double every subsequent DATA.
    if (increment(ack->block_num) == state_.block_num)
      return {};

    return make_error_code(errc::unexpected_packet);
  }

  if (state_.last_block)
  {
    state_.complete = true;
    return {};
  }

  auto err = next_block();
  if (err)
    return err;

  transmit(ctx, socket);
  return {};
}

auto session::on_data(async_context &ctx, const socket_dialog &socket,
                      const packet &pkt) -> std::error_code
{
  const auto *data = std::get_if<data_packet>(&pkt);
  if (!data)
    return make_error_code(errc::unexpected_packet);

  // The peer missed our last ACK.
  if (data->block_num == state_.block_num)
  {
    send(ctx, socket);
    return {};
  }

  if (data->block_num != increment(state_.block_num))
    return make_error_code(errc::unexpected_packet);

  auto err = filesystem::write_chunk(*state_.file, data->bytes());
  if (err)
    return err;

  state_.block_num = data->block_num;
  encode(ack_packet{.block_num = state_.block_num}, state_.buffer);

  if (data->last())
  {
    err = filesystem::commit(*state_.file, state_.tmp, state_.target);
    if (err) [[unlikely]]
      return err; // GCOVR_EXCL_LINE

    state_.tmp.clear();
    state_.complete = true;
    send(ctx, socket);
    return {};
  }

  transmit(ctx, socket);
  return {};
}

auto session::send(async_context &ctx, const socket_dialog &socket) -> void
{
  using namespace stdexec;

  sender auto sendmsg =
      io::sendmsg(socket,
                  socket_message{.address = {peer_}, .buffers = state_.buffer},
                  0) |
      then([](auto &&) {}) | upon_error([](auto &&) {}); // GCOVR_EXCL_LINE

  ctx.scope.spawn(std::move(sendmsg));
}

auto session::transmit(async_context &ctx, const socket_dialog &socket) -> void
{
  send(ctx, socket);

  timer_ = ctx.timers.remove(timer_);
  timer_ = ctx.timers.add(
      options_.timeout,
      [&, socket, retries = 0U](auto) mutable {
        if (retries++ >= options_.max_retries)
          return finish(ctx, socket, make_error_code(errc::timed_out));

        spdlog::debug("{}:{}:Retransmitting block {} ({}/{}).", tag(),
                      addrstr_, state_.block_num, retries,
                      options_.max_retries);
        send(ctx, socket);
      },
      options_.timeout);
}

auto session::finish(async_context &ctx, const socket_dialog &socket,
                     std::error_code err) -> void
{
  if (stopped_)
    return;

  stopped_ = true;
  timer_ = ctx.timers.remove(timer_);

  if (!err)
  {
    spdlog::info("{}:{}:Completed {}.", tag(), addrstr_,
                 state_.target.c_str());
  }
  else if (err == errc::peer_aborted ||
           err == std::errc::operation_canceled)
  {
    spdlog::info("{}:{}:{}", tag(), addrstr_, err.message());
  }
  else
  {
    spdlog::error("{}:{}:{}", tag(), addrstr_, err.message());

    const auto reply = errors::packet(to_wire_error(err));
    state_.buffer.assign(reply.begin(), reply.end());
    send(ctx, socket);
  }

  cleanup();

  // Shutdown the read-side of the socket.
  // This removes the socket from the underlying event-loop.
  io::shutdown(socket, SHUT_RD);
  ctx.signal(ctx.terminate);
}
} // namespace tftpsrv
