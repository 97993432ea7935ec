/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * tftpkit is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * tftpkit is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with tftpkit.  If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file server.hpp
 * @brief This file declares the TFTP server listener.
 */
#pragma once
#ifndef TFTPKIT_SERVER_HPP
#define TFTPKIT_SERVER_HPP
#include "tftpkit/config.hpp"
#include "tftpkit/events.hpp"
#include "tftpkit/session_manager.hpp"

#include <net/cppnet.hpp>

#include <filesystem>
#include <memory>
/** @brief TFTP related utilities. */
namespace tftpkit {
/** @brief TFTP max buffer allocation. */
static constexpr auto BUFSIZE = messages::DATAMSG_MAXLEN;
/** @brief The service type to use. */
template <typename UDPStreamHandler>
using udp_base = net::service::async_udp_service<UDPStreamHandler, BUFSIZE>;

/** @brief A TFTP server. */
class server : public udp_base<server> {
public:
  /** @brief The base class. */
  using Base = udp_base<server>;
  /** @brief The socket message type. */
  using socket_message = io::socket::socket_message<sockaddr_in6>;
  /** @brief The socket address type. */
  using address_type = session_manager::address_type;

  /**
   * @brief Constructs a TFTP server on the socket address.
   * @tparam T The type of the socket_address.
   * @param address The local IP address to bind to.
   * @param root The canonical root directory.
   * @param options Retransmission settings for new sessions.
   * @param control State shared with the controlling thread.
   * @param sink Receives the events of every session.
   */
  template <typename T>
  server(socket_address<T> address, std::filesystem::path root,
         session_options options, std::shared_ptr<server_control> control,
         event_sink sink = {})
      : Base(address),
        sessions_(std::move(root), options, std::move(sink), std::move(control))
  {}

  server(const server &) = delete;
  server(server &&) = delete;
  auto operator=(const server &) -> server & = delete;
  auto operator=(server &&) -> server & = delete;

  /** @brief Aborts every live session. */
  ~server();

  /**
   * @brief Routes a datagram read from the listener or a transfer ID.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param rctx The read context that manages the read buffer lifetime.
   * @param buf The bytes that were read from the socket.
   */
  auto operator()(async_context &ctx, const socket_dialog &socket,
                  const std::shared_ptr<read_context> &rctx,
                  std::span<const std::byte> buf) -> void;

  /**
   * @brief Delivers an expired session deadline.
   * @param peer The session's peer.
   * @param socket The session's transfer ID.
   */
  auto expire(const address_type &peer,
              session_manager::socket_type socket) -> void;

  /** @brief Returns true once the event loop has shut down. */
  [[nodiscard]] auto stopped() const noexcept -> bool { return stopped_; }

private:
  /** @brief The TFTP sessions. */
  session_manager sessions_;
  /** @brief Set once the event loop can no longer be used. */
  bool stopped_ = false;
};
} // namespace tftpkit
#endif // TFTPKIT_SERVER_HPP
